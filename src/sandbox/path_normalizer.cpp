#include "path_normalizer.hpp"

#include <pathjail/core/utils.hpp>

#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <unicode/stringpiece.h>
#include <unicode/utypes.h>

namespace pathjail {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool has_percent_escape(const std::string& s) {
    for (size_t i = 0; i + 2 < s.size(); ++i) {
        if (s[i] == '%' && hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            return true;
        }
    }
    return false;
}

bool has_control_byte(const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < 0x20 || c == 0x7F) return true;
    }
    return false;
}

bool is_separator(char c) {
    return c == '/' || c == '\\';
}

// "...", "...." etc. Some platforms strip trailing dots, turning these into "..".
bool is_dot_run(const std::string& seg) {
    return seg.size() >= 3 && seg.find_first_not_of('.') == std::string::npos;
}

} // namespace

Result<std::string> percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '%') {
            out.push_back(s[i]);
            continue;
        }
        if (i + 2 >= s.size()) {
            return Result<std::string>::fail(ErrorKind::InvalidPath,
                                             "truncated percent escape");
        }
        int hi = hex_value(s[i + 1]);
        int lo = hex_value(s[i + 2]);
        if (hi < 0 || lo < 0) {
            return Result<std::string>::fail(ErrorKind::InvalidPath,
                                             "malformed percent escape");
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return Result<std::string>::ok(out);
}

Result<std::string> normalize_nfc(const std::string& utf8) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status) || nfc == nullptr) {
        return Result<std::string>::fail(ErrorKind::InvalidPath,
            std::string("NFC normalizer unavailable: ") + u_errorName(status));
    }

    icu::UnicodeString src = icu::UnicodeString::fromUTF8(icu::StringPiece(utf8));
    if (src.isBogus()) {
        return Result<std::string>::fail(ErrorKind::InvalidPath, "unicode conversion failed");
    }

    if (nfc->isNormalized(src, status) && U_SUCCESS(status)) {
        return Result<std::string>::ok(utf8);
    }
    status = U_ZERO_ERROR;

    icu::UnicodeString dst = nfc->normalize(src, status);
    if (U_FAILURE(status) || dst.isBogus()) {
        return Result<std::string>::fail(ErrorKind::InvalidPath,
            std::string("NFC normalization failed: ") + u_errorName(status));
    }

    std::string out;
    dst.toUTF8String(out);
    return Result<std::string>::ok(out);
}

PathNormalizer::PathNormalizer(const SandboxOptions& options)
    : max_path_length_(options.max_path_length)
    , max_segments_(options.max_segments)
    , max_segment_length_(options.max_segment_length) {}

Result<NormalizedInput> PathNormalizer::normalize(const std::string& raw) const {
    typedef Result<NormalizedInput> R;

    if (raw.size() > max_path_length_) {
        return R::fail(ErrorKind::InvalidPath,
                       "path exceeds " + std::to_string(max_path_length_) + " bytes");
    }

    std::string text = trim(raw);
    if (text.empty()) {
        return R::fail(ErrorKind::InvalidPath, "empty path");
    }

    Result<std::string> decoded = percent_decode(text);
    if (!decoded.success) {
        return R::fail(decoded.error);
    }
    if (has_percent_escape(decoded.value)) {
        return R::fail(ErrorKind::InvalidPath, "nested percent encoding");
    }
    if (has_control_byte(decoded.value)) {
        return R::fail(ErrorKind::InvalidPath, "control character in path");
    }
    if (!is_valid_utf8(decoded.value)) {
        return R::fail(ErrorKind::InvalidPath, "path is not valid UTF-8");
    }

    Result<std::string> composed = normalize_nfc(decoded.value);
    if (!composed.success) {
        return R::fail(composed.error);
    }
    if (composed.value.size() > max_path_length_) {
        return R::fail(ErrorKind::InvalidPath,
                       "normalized path exceeds " + std::to_string(max_path_length_) + " bytes");
    }

    NormalizedInput out;
    out.text = composed.value;

    std::string current;
    for (size_t i = 0; i <= out.text.size(); ++i) {
        if (i < out.text.size() && !is_separator(out.text[i])) {
            current.push_back(out.text[i]);
            continue;
        }
        if (current.empty() || current == ".") {
            current.clear();
            continue;
        }
        if (current.size() > max_segment_length_) {
            return R::fail(ErrorKind::InvalidPath,
                           "segment exceeds " + std::to_string(max_segment_length_) + " bytes");
        }
        if (is_dot_run(current)) {
            return R::fail(ErrorKind::InvalidPath, "dot-only segment '" + current + "'");
        }
        out.segments.push_back(current);
        if (out.segments.size() > max_segments_) {
            return R::fail(ErrorKind::InvalidPath,
                           "more than " + std::to_string(max_segments_) + " segments");
        }
        current.clear();
    }

    return R::ok(out);
}

} // namespace pathjail
