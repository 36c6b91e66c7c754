#include "path_classifier.hpp"

#include <pathjail/core/utils.hpp>

#include <cctype>

namespace pathjail {

namespace {

bool is_sep(char c) {
    return c == '/' || c == '\\';
}

bool is_scheme_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '+' || c == '-' || c == '.';
}

} // namespace

bool is_absolute_form(const std::string& path, std::string* form) {
    std::string p = trim(path);
    if (p.empty()) return false;

    std::string found;
    if (p.size() >= 2 && is_sep(p[0]) && is_sep(p[1])) {
        found = "UNC or network path";
    } else if (is_sep(p[0])) {
        found = "leading separator";
    } else if (p.size() >= 2 && std::isalpha(static_cast<unsigned char>(p[0])) && p[1] == ':') {
        found = "drive letter";
    } else if (p[0] == '~') {
        found = "home directory";
    } else if (std::isalpha(static_cast<unsigned char>(p[0]))) {
        // scheme ":" followed by a separator, scheme at least two chars
        size_t i = 1;
        while (i < p.size() && is_scheme_char(p[i])) ++i;
        if (i >= 2 && i + 1 < p.size() && p[i] == ':' && is_sep(p[i + 1])) {
            found = "URI scheme";
        }
    }

    if (found.empty()) return false;
    if (form) *form = found;
    return true;
}

Classification classify(const std::string& raw, const NormalizedInput& input) {
    Classification c;

    std::string form;
    if (is_absolute_form(raw, &form) || is_absolute_form(input.text, &form)) {
        c.kind = PathClass::AbsoluteRejected;
        c.reason = "absolute path (" + form + ")";
        return c;
    }

    // Resolve ".." against the segments already descended. Depth below
    // zero means the path climbs out of the root.
    std::vector<std::string> resolved;
    for (size_t i = 0; i < input.segments.size(); ++i) {
        const std::string& seg = input.segments[i];
        if (seg == "..") {
            if (resolved.empty()) {
                c.kind = PathClass::TraversalRejected;
                c.reason = "'..' at segment " + std::to_string(i + 1) + " escapes the root";
                return c;
            }
            resolved.pop_back();
        } else {
            resolved.push_back(seg);
        }
    }

    c.kind = PathClass::Valid;
    c.path.segments = resolved;
    return c;
}

} // namespace pathjail
