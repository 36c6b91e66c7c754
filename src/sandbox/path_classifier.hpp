/*
 * pathjail C++17 - Path Classifier
 */
#ifndef pathjail_SANDBOX_PATH_CLASSIFIER_HPP
#define pathjail_SANDBOX_PATH_CLASSIFIER_HPP

#include "path_normalizer.hpp"
#include <pathjail/sandbox/paths.hpp>

#include <string>

namespace pathjail {

enum class PathClass {
    Valid,
    AbsoluteRejected,
    TraversalRejected
};

struct Classification {
    PathClass kind;
    CanonicalPath path;     // set when kind == Valid
    std::string reason;     // set otherwise

    Classification() : kind(PathClass::Valid) {}
};

// Recognizes absolute forms of every platform, whatever the host is:
// leading separator, UNC ("\\server\share", "//server"), drive letter
// ("C:", "C:\", "C:rel"), URI scheme ("file://", "smb:\"), home ("~").
// On a match, form names the convention.
bool is_absolute_form(const std::string& path, std::string* form);

// raw is the caller's string, input its normalized form. Both are checked
// for absolute forms so an encoded "%2Fetc" is caught too.
Classification classify(const std::string& raw, const NormalizedInput& input);

} // namespace pathjail

#endif // pathjail_SANDBOX_PATH_CLASSIFIER_HPP
