/*
 * pathjail C++17 - Symlink Guard
 *
 * Walks a canonical path from the sandbox root with lstat, one component
 * at a time, and reports the first component that is link-class:
 *   - symbolic link
 *   - anything that is neither a regular file nor a directory
 *   - a regular file with more than one hard link (policy)
 *   - an entry on another device than the root (policy)
 * Components that do not exist yet end the walk without a finding.
 */
#ifndef pathjail_SANDBOX_SYMLINK_GUARD_HPP
#define pathjail_SANDBOX_SYMLINK_GUARD_HPP

#include "sandbox_root.hpp"
#include <pathjail/core/error.hpp>
#include <pathjail/sandbox/options.hpp>
#include <pathjail/sandbox/paths.hpp>

#include <string>
#include <sys/stat.h>

namespace pathjail {

struct LinkFinding {
    bool found;
    std::string component;  // relative path up to the offending segment
    std::string reason;

    LinkFinding() : found(false) {}
};

// Empty when st is acceptable inside the sandbox, otherwise a short reason
std::string link_class_violation(const struct stat& st, dev_t root_dev,
                                 const SandboxOptions& options);

Result<LinkFinding> find_link_component(const SandboxRoot& root,
                                        const CanonicalPath& path,
                                        const SandboxOptions& options);

} // namespace pathjail

#endif // pathjail_SANDBOX_SYMLINK_GUARD_HPP
