#include <filedb-cpp/path.hpp>

namespace filedb_cpp {

auto join_path(std::span<const std::string> keys) -> std::string {
    auto result = std::string{};
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) result.push_back('.');
        result += keys[i];
    }
    return result;
}

auto split_path(std::string_view dotted) -> Path {
    if (dotted.empty()) return {};
    auto keys = Path{};
    auto pos = std::size_t{0};
    while (true) {
        auto next = dotted.find('.', pos);
        keys.emplace_back(dotted.substr(pos, next - pos));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return keys;
}

}  // namespace filedb_cpp
