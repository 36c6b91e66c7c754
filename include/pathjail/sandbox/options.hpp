/*
 * pathjail C++17 - Sandbox options
 */
#ifndef pathjail_SANDBOX_OPTIONS_HPP
#define pathjail_SANDBOX_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <functional>

namespace pathjail {

class Config;
struct ResolvedPath;

struct SandboxOptions {
    size_t max_path_length;     // bytes, raw and normalized input
    size_t max_segments;
    size_t max_segment_length;  // bytes per segment
    bool reject_hardlinks;      // regular files with st_nlink > 1 count as links
    bool allow_mount_crossing;  // entries on another device than the root
    uint64_t max_read_bytes;

    // Called after a path is resolved and before the I/O walk starts.
    // Used by tests to inject filesystem races; unset in production.
    std::function<void(const ResolvedPath&)> pre_io_hook;

    SandboxOptions()
        : max_path_length(4096)
        , max_segments(256)
        , max_segment_length(255)
        , reject_hardlinks(true)
        , allow_mount_crossing(false)
        , max_read_bytes(64ULL * 1024 * 1024) {}

    // Read the "sandbox.*" keys; absent or invalid values keep the defaults.
    static SandboxOptions from_config(const Config& cfg);
};

} // namespace pathjail

#endif // pathjail_SANDBOX_OPTIONS_HPP
