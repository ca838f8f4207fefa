#include <filedb-cpp/value.hpp>

namespace filedb_cpp {

auto operator==(const Value& a, const Value& b) -> bool {
    return a.inner == b.inner;
}

}  // namespace filedb_cpp
