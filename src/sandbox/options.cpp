#include <pathjail/sandbox/options.hpp>
#include <pathjail/core/config.hpp>

namespace pathjail {

SandboxOptions SandboxOptions::from_config(const Config& cfg) {
    SandboxOptions opts;

    int64_t v = cfg.get_int("sandbox.max_path_length", 0);
    if (v > 0) opts.max_path_length = static_cast<size_t>(v);

    v = cfg.get_int("sandbox.max_segments", 0);
    if (v > 0) opts.max_segments = static_cast<size_t>(v);

    v = cfg.get_int("sandbox.max_segment_length", 0);
    if (v > 0) opts.max_segment_length = static_cast<size_t>(v);

    v = cfg.get_int("sandbox.max_read_bytes", 0);
    if (v > 0) opts.max_read_bytes = static_cast<uint64_t>(v);

    opts.reject_hardlinks = cfg.get_bool("sandbox.reject_hardlinks", opts.reject_hardlinks);
    opts.allow_mount_crossing = cfg.get_bool("sandbox.allow_mount_crossing", opts.allow_mount_crossing);

    return opts;
}

} // namespace pathjail
