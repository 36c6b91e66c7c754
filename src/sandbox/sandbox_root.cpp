#include "sandbox_root.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fcntl.h>
#include <sys/stat.h>

namespace pathjail {

Result<SandboxRoot> open_sandbox_root(const std::string& dir) {
    typedef Result<SandboxRoot> R;

    if (dir.empty()) {
        return R::fail(ErrorKind::InvalidPath, "sandbox root is empty");
    }

    // Strip trailing separators so lstat sees the link itself, not its target
    std::string given = dir;
    while (given.size() > 1 && given[given.size() - 1] == '/') {
        given.erase(given.size() - 1);
    }

    struct stat lst;
    if (lstat(given.c_str(), &lst) != 0) {
        return R::fail(error_from_errno(errno, "sandbox root " + given));
    }
    if (S_ISLNK(lst.st_mode)) {
        return R::fail(ErrorKind::SymbolicLinkRejected,
                       "sandbox root " + given + " is a symbolic link");
    }
    if (!S_ISDIR(lst.st_mode)) {
        return R::fail(ErrorKind::IoError, "sandbox root " + given + " is not a directory");
    }

    char resolved[PATH_MAX];
    if (!realpath(given.c_str(), resolved)) {
        return R::fail(error_from_errno(errno, "realpath " + given));
    }

    SandboxRoot root;
    root.path = resolved;
    root.fd.reset(open(root.path.c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC));
    if (!root.fd.valid()) {
        return R::fail(error_from_errno(errno, "open sandbox root " + root.path));
    }

    struct stat st;
    if (fstat(root.fd.get(), &st) != 0) {
        return R::fail(error_from_errno(errno, "fstat sandbox root " + root.path));
    }
    // The directory we opened must be the one we inspected
    if (st.st_dev != lst.st_dev || st.st_ino != lst.st_ino) {
        return R::fail(ErrorKind::SymbolicLinkRejected,
                       "sandbox root " + given + " changed while opening");
    }

    root.dev = st.st_dev;
    root.ino = st.st_ino;
    return R::ok(std::move(root));
}

} // namespace pathjail
