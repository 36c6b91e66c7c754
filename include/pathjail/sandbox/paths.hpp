/*
 * pathjail C++17 - Path value types
 *
 * CanonicalPath: relative, separator-unified, dot-free segment list.
 * ResolvedPath:  CanonicalPath joined to the sandbox root after every
 *                check passed. Produced per call, never cached.
 */
#ifndef pathjail_SANDBOX_PATHS_HPP
#define pathjail_SANDBOX_PATHS_HPP

#include <string>
#include <vector>

namespace pathjail {

struct CanonicalPath {
    std::vector<std::string> segments;   // no "", ".", ".."

    bool is_root() const { return segments.empty(); }

    // "a/b/c", or "." for the root
    std::string to_string() const;
};

struct ResolvedPath {
    std::string absolute;        // root + "/" + relative
    CanonicalPath relative;

    bool is_root() const { return relative.is_root(); }
    const std::string& name() const { return relative.segments.back(); }
};

// True when path equals root or lies below it. Requires a separator right
// after the root prefix, so "/sandbox-evil" is not inside "/sandbox".
bool is_within_root(const std::string& path, const std::string& root);

} // namespace pathjail

#endif // pathjail_SANDBOX_PATHS_HPP
