#include "symlink_guard.hpp"

#include <cerrno>

namespace pathjail {

std::string link_class_violation(const struct stat& st, dev_t root_dev,
                                 const SandboxOptions& options) {
    if (S_ISLNK(st.st_mode)) {
        return "symbolic link";
    }
    if (!S_ISREG(st.st_mode) && !S_ISDIR(st.st_mode)) {
        return "special file";
    }
    if (S_ISREG(st.st_mode) && options.reject_hardlinks && st.st_nlink > 1) {
        return "hard link";
    }
    if (!options.allow_mount_crossing && st.st_dev != root_dev) {
        return "mount point";
    }
    return "";
}

Result<LinkFinding> find_link_component(const SandboxRoot& root,
                                        const CanonicalPath& path,
                                        const SandboxOptions& options) {
    typedef Result<LinkFinding> R;

    LinkFinding finding;
    std::string current = root.path;
    std::string relative;

    for (size_t i = 0; i < path.segments.size(); ++i) {
        const std::string& seg = path.segments[i];
        if (current.empty() || current[current.size() - 1] != '/') {
            current += '/';
        }
        current += seg;
        relative += (i == 0 ? "" : "/") + seg;

        struct stat st;
        if (lstat(current.c_str(), &st) != 0) {
            int err = errno;
            // Not there yet (or a parent is a file): nothing further to inspect
            if (err == ENOENT || err == ENOTDIR) {
                return R::ok(finding);
            }
            return R::fail(error_from_errno(err, "lstat " + relative));
        }

        std::string violation = link_class_violation(st, root.dev, options);
        if (!violation.empty()) {
            finding.found = true;
            finding.component = relative;
            finding.reason = violation;
            return R::ok(finding);
        }

        if (!S_ISDIR(st.st_mode)) {
            // A file in the middle of the path; the I/O step reports it
            return R::ok(finding);
        }
    }

    return R::ok(finding);
}

} // namespace pathjail
