// todo_store -- a tiny command-line todo list kept in one JSON file
//
// Usage:
//   todo_store <file> add <id> <title>
//   todo_store <file> done <id>
//   todo_store <file> drop <id>
//   todo_store <file> list
//
// Every command is one execute() call: the whole file is read, changed
// in memory and written back.

#include <filedb-cpp/filedb.hpp>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>

namespace fdb = filedb_cpp;

namespace {

auto usage() -> int {
    std::fprintf(stderr,
                 "usage: todo_store <file> add <id> <title>\n"
                 "       todo_store <file> done <id>\n"
                 "       todo_store <file> drop <id>\n"
                 "       todo_store <file> list\n");
    return 2;
}

void list(const fdb::Document& doc) {
    auto todos = doc.ref("todos").try_get();
    const auto* items = todos ? todos->as_object() : nullptr;
    if (!items || items->empty()) {
        std::printf("(nothing to do)\n");
        return;
    }
    for (const auto& [id, item] : *items) {
        const auto* fields = item.as_object();
        if (!fields) continue;
        auto title = std::string{};
        auto done = false;
        if (auto it = fields->find("title"); it != fields->end()) {
            title = fdb::get_as<std::string>(it->second).value_or("");
        }
        if (auto it = fields->find("done"); it != fields->end()) {
            done = fdb::get_as<bool>(it->second).value_or(false);
        }
        std::printf("[%c] %s  %s\n", done ? 'x' : ' ', id.c_str(), title.c_str());
    }
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 3) return usage();

    auto options = fdb::DocumentOptions{};
    options.on_load_failure = fdb::LoadFailurePolicy::propagate;
    options.indent = 2;
    auto doc = fdb::Document{argv[1], options};
    const auto* cmd = argv[2];

    try {
        // Refuse to overwrite a file we cannot parse, but allow starting fresh.
        if (!std::filesystem::exists(doc.path())) {
            doc.store(fdb::Object{{"todos", fdb::Object{}}});
        }

        if (std::strcmp(cmd, "add") == 0 && argc == 5) {
            auto item = doc.ref("todos").child(argv[3]);
            fdb::execute(fdb::combine(item.child("title").set(argv[4]),
                                      item.child("done").set(false)));
        } else if (std::strcmp(cmd, "done") == 0 && argc == 4) {
            fdb::execute(doc.ref("todos").child(argv[3]).child("done").set(true));
        } else if (std::strcmp(cmd, "drop") == 0 && argc == 4) {
            fdb::execute(doc.ref("todos").child(argv[3]).remove());
        } else if (std::strcmp(cmd, "list") == 0 && argc == 3) {
            list(doc);
        } else {
            return usage();
        }
    } catch (const fdb::Exception& e) {
        std::fprintf(stderr, "todo_store: %s\n", e.what());
        return 1;
    }
    return 0;
}
