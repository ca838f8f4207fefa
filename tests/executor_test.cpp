#include <filedb-cpp/filedb.hpp>

#include "temp_dir.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using namespace filedb_cpp;

// -- Set / get / remove through storage ---------------------------------------

TEST(Execute, set_then_get_yields_value) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.file("d.json")};
    const auto values = std::vector<Value>{
        Value{1}, Value{"s"}, Value{2.5}, Value{true}, Value{Null{}},
        Value{Array{1, "x"}}, Value{Object{{"k", Object{}}}},
    };
    for (const auto& v : values) {
        execute(doc.at("p.q").set(v));
        EXPECT_EQ(doc.at("p.q").get(), v);
    }
}

TEST(Execute, remove_then_get_is_not_found) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.file("d.json")};
    execute(doc.at("a.b").set(1));
    execute(doc.at("a.b").remove());
    try {
        doc.at("a.b").get();
        FAIL() << "expected not_found";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::not_found);
    }
    EXPECT_EQ(doc.ref("a").get(), Value{Object{}});
}

TEST(Execute, update_increments_stored_number) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.write("d.json", R"({"a":{"b":5}})")};
    execute(doc.ref("a").child("b").update([](const std::optional<Value>& current) {
        return Value{get_as<std::int64_t>(current).value_or(0) + 1};
    }));
    EXPECT_EQ(doc.ref("a").child("b").get(), Value{6});
}

TEST(Execute, set_on_empty_document_builds_nested_objects) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.file("d.json")};
    execute(doc.ref("a").child("b").child("c").set("V"));
    EXPECT_EQ(TempDir::read(doc.path()), R"({"a":{"b":{"c":"V"}}})");
}

TEST(Execute, preserves_unrelated_keys) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.write("d.json", R"({"keep":{"x":1},"other":[1,2]})")};
    execute(doc.at("keep.y").set(2));
    EXPECT_EQ(doc.load(), (Object{
        {"keep", Object{{"x", 1}, {"y", 2}}},
        {"other", Array{1, 2}},
    }));
}

// -- Failures -----------------------------------------------------------------

TEST(Execute, type_mismatch_leaves_file_untouched) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.file("d.json")};
    execute(doc.ref("a").set(5));
    const auto before = TempDir::read(doc.path());

    try {
        execute(doc.ref("a").child("b").set(1));
        FAIL() << "expected type_mismatch";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::type_mismatch);
        EXPECT_EQ(e.error().path, "a.b");
        EXPECT_EQ(e.error().at, "a");
    }
    EXPECT_EQ(TempDir::read(doc.path()), before);
}

TEST(Execute, failed_apply_on_missing_file_creates_nothing) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.file("d.json")};
    EXPECT_THROW(execute(doc.root().set(1)), Exception);
    EXPECT_FALSE(std::filesystem::exists(doc.path()));
}

// -- combine ------------------------------------------------------------------

TEST(Execute, combined_transaction_is_one_store) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.write("d.json", R"({"b":"gone"})")};
    execute(combine(doc.ref("a").set(1), doc.ref("b").remove()));
    EXPECT_EQ(TempDir::read(doc.path()), R"({"a":1})");
}

TEST(Execute, failing_member_persists_nothing) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.write("d.json", R"({"s":"scalar"})")};
    EXPECT_THROW(execute(combine(doc.ref("a").set(1), doc.at("s.x").set(2))), Exception);
    EXPECT_EQ(TempDir::read(doc.path()), R"({"s":"scalar"})");
}

// -- Load failure policy ------------------------------------------------------

TEST(Execute, corrupt_file_is_treated_as_empty_by_default) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.write("d.json", "this is not json")};
    execute(doc.ref("a").set(1));
    EXPECT_EQ(TempDir::read(doc.path()), R"({"a":1})");
}

TEST(Execute, deeply_nested_file_is_treated_as_empty_by_default) {
    auto tmp = TempDir{};
    const auto levels = std::size_t{200000};
    const auto doc = Document{tmp.write(
        "d.json", "{\"a\":" + std::string(levels, '[') + std::string(levels, ']') + "}")};
    execute(doc.ref("b").set(1));
    EXPECT_EQ(TempDir::read(doc.path()), R"({"b":1})");
}

TEST(Execute, missing_file_is_created) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.file("new.json")};
    execute(doc.ref("a").set(1));
    EXPECT_TRUE(std::filesystem::exists(doc.path()));
    EXPECT_EQ(doc.ref("a").get(), Value{1});
}

TEST(Execute, propagate_policy_rejects_corrupt_file) {
    auto tmp = TempDir{};
    auto options = DocumentOptions{};
    options.on_load_failure = LoadFailurePolicy::propagate;
    const auto doc = Document{tmp.write("d.json", "this is not json"), options};

    try {
        execute(doc.ref("a").set(1));
        FAIL() << "expected parse_error";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::parse_error);
    }
    EXPECT_EQ(TempDir::read(doc.path()), "this is not json");
}

// -- Store failure policy -----------------------------------------------------

TEST(Execute, store_failure_propagates_by_default) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.file("missing_dir/d.json")};
    try {
        execute(doc.ref("a").set(1));
        FAIL() << "expected io_error";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::io_error);
    }
}

TEST(Execute, ignore_policy_drops_store_failure) {
    auto tmp = TempDir{};
    auto options = DocumentOptions{};
    options.on_store_failure = StoreFailurePolicy::ignore;
    const auto doc = Document{tmp.file("missing_dir/d.json"), options};

    EXPECT_NO_THROW(execute(doc.ref("a").set(1)));
    EXPECT_FALSE(std::filesystem::exists(doc.path()));
}

TEST(Execute, non_finite_number_is_rejected_and_nothing_stored) {
    auto tmp = TempDir{};
    const auto doc = Document{tmp.write("d.json", R"({"x":1})")};
    try {
        execute(doc.ref("x").set(std::numeric_limits<double>::quiet_NaN()));
        FAIL() << "expected invalid_value";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_value);
    }
    EXPECT_EQ(TempDir::read(doc.path()), R"({"x":1})");
    EXPECT_EQ(doc.ref("x").get(), Value{1});
}

// -- Independent documents ----------------------------------------------------

TEST(Execute, two_handles_on_one_file_see_each_others_writes) {
    auto tmp = TempDir{};
    const auto writer = Document{tmp.file("d.json")};
    const auto reader = Document{tmp.file("d.json")};

    execute(writer.ref("a").set(1));
    EXPECT_EQ(reader.ref("a").get(), Value{1});

    execute(reader.ref("b").set(2));
    EXPECT_EQ(writer.load(), (Object{{"a", 1}, {"b", 2}}));
}
