#include <filedb-cpp/document.hpp>
#include <filedb-cpp/json.hpp>
#include <filedb-cpp/path.hpp>
#include <filedb-cpp/ref.hpp>

#include "document_state.hpp"
#include "storage/file_io.hpp"

#include <easylogging++.h>

#include <memory>
#include <ostream>
#include <string>
#include <utility>

namespace filedb_cpp {

Document::Document(std::filesystem::path path, DocumentOptions options)
    : state_{std::make_shared<detail::DocumentState>(
          detail::DocumentState{std::move(path), options})} {}

auto Document::path() const -> const std::filesystem::path& {
    return state_->path;
}

auto Document::options() const -> const DocumentOptions& {
    return state_->options;
}

auto Document::ref(std::string_view key) const -> Ref {
    return Ref{*this, Path{std::string{key}}};
}

auto Document::root() const -> Ref {
    return Ref{*this, Path{}};
}

auto Document::at(std::string_view dotted) const -> Ref {
    return Ref{*this, split_path(dotted)};
}

auto Document::load() const -> Object {
    auto text = detail::read_file(state_->path);
    try {
        return parse_object(text);
    } catch (const Exception& e) {
        throw Exception{ErrorKind::parse_error,
                        "cannot parse '" + state_->path.string() + "': " + e.what()};
    }
}

void Document::store(const Object& root) const {
    auto text = dump_object(root, state_->options.indent);
    if (state_->options.atomic_write) {
        detail::replace_file(state_->path, text);
    } else {
        detail::overwrite_file(state_->path, text);
    }
    LOG(DEBUG) << "stored " << text.size() << " bytes to " << state_->path.string();
}

auto operator<<(std::ostream& os, const Document& doc) -> std::ostream& {
    return os << doc.path().string();
}

}  // namespace filedb_cpp
