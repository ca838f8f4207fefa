#include <filedb-cpp/filedb.hpp>

#include "temp_dir.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <string>

using namespace filedb_cpp;

// -- Navigation ---------------------------------------------------------------

TEST(Ref, child_extends_path_without_mutating_parent) {
    const auto doc = Document{"x.json"};
    const auto parent = doc.ref("a");
    const auto first = parent.child("b");
    const auto second = parent.child("c");

    EXPECT_EQ(parent.path(), Path{"a"});
    EXPECT_EQ(first.path(), (Path{"a", "b"}));
    EXPECT_EQ(second.path(), (Path{"a", "c"}));
    EXPECT_EQ(first.document(), doc);
}

TEST(Ref, subscript_is_child) {
    const auto doc = Document{"x.json"};
    EXPECT_EQ(doc.ref("a")["b"]["c"].path(), (Path{"a", "b", "c"}));
    EXPECT_EQ(doc.ref("a")["b"].dotted(), "a.b");
}

// -- get ----------------------------------------------------------------------

TEST(Ref, get_reads_nested_value) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.write("d.json", R"({"a":{"b":{"c":"deep"}}})")};

    EXPECT_EQ(doc.ref("a").child("b").child("c").get(), Value{"deep"});
    EXPECT_EQ(doc.ref("a").child("b").get(), (Value{Object{{"c", "deep"}}}));
}

TEST(Ref, root_get_returns_whole_document) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.write("d.json", R"({"x":1})")};
    EXPECT_EQ(doc.root().get(), (Value{Object{{"x", 1}}}));
}

TEST(Ref, get_missing_key_is_not_found) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.write("d.json", R"({"a":{}})")};
    try {
        doc.ref("a").child("missing").get();
        FAIL() << "expected not_found";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::not_found);
    }
}

TEST(Ref, get_on_missing_file_is_not_found) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.file("missing.json")};
    try {
        doc.ref("a").get();
        FAIL() << "expected not_found";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::not_found);
    }
}

TEST(Ref, get_on_corrupt_file_is_not_found) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.write("d.json", "{{{")};
    try {
        doc.root().get();
        FAIL() << "expected not_found";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::not_found);
    }
}

TEST(Ref, get_on_deeply_nested_file_is_not_found) {
    auto tmp = TempDir{};
    const auto levels = std::size_t{200000};
    const auto doc = Document{tmp.write(
        "d.json", "{\"a\":" + std::string(levels, '[') + std::string(levels, ']') + "}")};
    try {
        doc.ref("a").get();
        FAIL() << "expected not_found";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::not_found);
    }
}

TEST(Ref, get_through_scalar_is_type_mismatch) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.write("d.json", R"({"a":"text"})")};
    try {
        doc.ref("a").child("b").child("c").get();
        FAIL() << "expected type_mismatch";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::type_mismatch);
        EXPECT_EQ(e.error().path, "a.b.c");
        EXPECT_EQ(e.error().at, "a");
    }
}

// -- try_get / typed get ------------------------------------------------------

TEST(Ref, try_get_returns_nullopt_when_absent) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.write("d.json", R"({"a":1})")};

    EXPECT_FALSE(doc.ref("b").try_get().has_value());
    EXPECT_EQ(doc.ref("a").try_get(), Value{1});
}

TEST(Ref, try_get_still_throws_type_mismatch) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.write("d.json", R"({"a":1})")};
    EXPECT_THROW(doc.ref("a").child("b").try_get(), Exception);
}

TEST(Ref, typed_get) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.write("d.json", R"({"name":"Alice","age":30})")};

    EXPECT_EQ(doc.ref("name").get<std::string>(), "Alice");
    EXPECT_EQ(doc.ref("age").get<std::int64_t>(), 30);
    EXPECT_FALSE(doc.ref("age").get<std::string>().has_value());
    EXPECT_FALSE(doc.ref("missing").get<std::int64_t>().has_value());
}

// -- Transaction construction is pure -----------------------------------------

TEST(Ref, transactions_are_bound_to_the_refs_document) {
    const auto doc = Document{"x.json"};
    const auto r = doc.ref("k");

    EXPECT_EQ(r.set(1).document(), doc);
    EXPECT_EQ(r.remove().document(), doc);
    EXPECT_EQ(r.update([](const std::optional<Value>&) { return Value{}; }).document(), doc);
}
