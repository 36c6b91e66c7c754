#include "resolver.hpp"
#include "path_classifier.hpp"
#include "symlink_guard.hpp"

namespace pathjail {

SandboxResolver::SandboxResolver(const SandboxRoot& root, const SandboxOptions& options)
    : root_(root)
    , options_(options)
    , normalizer_(options) {}

Result<ResolvedPath> SandboxResolver::resolve(const std::string& raw) const {
    typedef Result<ResolvedPath> R;

    Result<NormalizedInput> normalized = normalizer_.normalize(raw);
    if (!normalized.success) {
        return R::fail(normalized.error);
    }

    Classification cls = classify(raw, normalized.value);
    switch (cls.kind) {
        case PathClass::AbsoluteRejected:
            return R::fail(ErrorKind::AbsolutePathRejected, cls.reason);
        case PathClass::TraversalRejected:
            return R::fail(ErrorKind::TraversalRejected, cls.reason);
        case PathClass::Valid:
            break;
    }

    ResolvedPath resolved;
    resolved.relative = cls.path;
    resolved.absolute = root_.path;
    for (size_t i = 0; i < cls.path.segments.size(); ++i) {
        if (resolved.absolute[resolved.absolute.size() - 1] != '/') {
            resolved.absolute += '/';
        }
        resolved.absolute += cls.path.segments[i];
    }

    Result<LinkFinding> guard = find_link_component(root_, resolved.relative, options_);
    if (!guard.success) {
        return R::fail(guard.error);
    }
    if (guard.value.found) {
        return R::fail(ErrorKind::SymbolicLinkRejected,
                       guard.value.reason + " at '" + guard.value.component + "'");
    }

    // Independent of the classifier: catches any normalization slip
    if (!is_within_root(resolved.absolute, root_.path)) {
        return R::fail(ErrorKind::TraversalRejected,
                       "resolved path " + resolved.absolute + " is outside " + root_.path);
    }

    return R::ok(resolved);
}

} // namespace pathjail
