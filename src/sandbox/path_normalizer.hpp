/*
 * pathjail C++17 - Path Normalizer
 *
 * Turns an untrusted raw path into a segment list without touching the
 * filesystem:
 *   trim -> percent-decode (once) -> reject control bytes -> UTF-8 check
 *   -> NFC -> split on '/' and '\' -> drop "" and "."
 *
 * ".." segments are kept; resolving them is the classifier's job because
 * an escaping ".." must be reported as traversal, not silently clamped.
 */
#ifndef pathjail_SANDBOX_PATH_NORMALIZER_HPP
#define pathjail_SANDBOX_PATH_NORMALIZER_HPP

#include <pathjail/core/error.hpp>
#include <pathjail/sandbox/options.hpp>

#include <string>
#include <vector>

namespace pathjail {

struct NormalizedInput {
    std::string text;                   // decoded + NFC, original separators
    std::vector<std::string> segments;  // may contain ".."
};

// Decode %XX escapes once. Fails on a truncated or non-hex escape.
Result<std::string> percent_decode(const std::string& s);

// Unicode canonical composition (NFC) of a well-formed UTF-8 string
Result<std::string> normalize_nfc(const std::string& utf8);

class PathNormalizer {
public:
    explicit PathNormalizer(const SandboxOptions& options);

    Result<NormalizedInput> normalize(const std::string& raw) const;

private:
    size_t max_path_length_;
    size_t max_segments_;
    size_t max_segment_length_;
};

} // namespace pathjail

#endif // pathjail_SANDBOX_PATH_NORMALIZER_HPP
