#ifndef pathjail_SANDBOX_SANDBOX_ROOT_HPP
#define pathjail_SANDBOX_SANDBOX_ROOT_HPP

#include <pathjail/core/error.hpp>
#include <pathjail/core/unique_fd.hpp>

#include <string>
#include <sys/types.h>

namespace pathjail {

// The canonical root directory, held open for the lifetime of the
// service so every I/O walk starts from the same inode.
struct SandboxRoot {
    std::string path;   // realpath of the configured directory
    dev_t dev;
    ino_t ino;
    UniqueFd fd;

    SandboxRoot() : dev(0), ino(0) {}
};

// The directory must exist, be a directory and not be a symbolic link.
Result<SandboxRoot> open_sandbox_root(const std::string& dir);

} // namespace pathjail

#endif // pathjail_SANDBOX_SANDBOX_ROOT_HPP
