/*
 * pathjail C++17 - Sandbox Resolver
 *
 * normalize -> classify -> join to root -> symlink guard -> containment
 * check. The only way to turn caller input into a ResolvedPath. Internal
 * to the file service; stateless apart from the root it reads.
 */
#ifndef pathjail_SANDBOX_RESOLVER_HPP
#define pathjail_SANDBOX_RESOLVER_HPP

#include "path_normalizer.hpp"
#include "sandbox_root.hpp"
#include <pathjail/core/error.hpp>
#include <pathjail/sandbox/options.hpp>
#include <pathjail/sandbox/paths.hpp>

#include <string>

namespace pathjail {

class SandboxResolver {
public:
    SandboxResolver(const SandboxRoot& root, const SandboxOptions& options);

    Result<ResolvedPath> resolve(const std::string& raw) const;

private:
    const SandboxRoot& root_;
    const SandboxOptions& options_;
    PathNormalizer normalizer_;
};

} // namespace pathjail

#endif // pathjail_SANDBOX_RESOLVER_HPP
