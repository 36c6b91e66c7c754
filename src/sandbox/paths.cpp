#include <pathjail/sandbox/paths.hpp>
#include <pathjail/core/utils.hpp>

namespace pathjail {

std::string CanonicalPath::to_string() const {
    if (segments.empty()) return ".";
    return join(segments, "/");
}

bool is_within_root(const std::string& path, const std::string& root) {
    if (root.empty() || path.size() < root.size()) {
        return false;
    }
    if (path.compare(0, root.size(), root) != 0) {
        return false;
    }
    if (path.size() == root.size()) {
        return true;
    }
    // Root "/" already ends with the separator
    if (root[root.size() - 1] == '/') {
        return true;
    }
    return path[root.size()] == '/';
}

} // namespace pathjail
