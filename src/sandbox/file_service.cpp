/*
 * pathjail C++17 - Sandboxed File Service Implementation
 *
 * Validation goes through SandboxResolver. The I/O that follows never uses
 * the resolved absolute string: it starts from the root directory handle
 * and opens one component at a time with O_NOFOLLOW, keeping each
 * directory open by handle. A component replaced by a link between the
 * two steps fails with ELOOP/ENOTDIR and is reported, never followed.
 */
#include <pathjail/sandbox/file_service.hpp>
#include <pathjail/core/logger.hpp>
#include <pathjail/core/unique_fd.hpp>
#include <pathjail/core/utils.hpp>

#include "resolver.hpp"
#include "sandbox_root.hpp"
#include "symlink_guard.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace pathjail {

namespace {

const int kDirFlags = O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC;

struct DirCloser {
    void operator()(DIR* d) const {
        if (d) closedir(d);
    }
};
typedef std::unique_ptr<DIR, DirCloser> DirPtr;

// Raw paths go to the log; keep control bytes out of it
std::string printable(const std::string& s) {
    std::string out = truncate_safe(s, 512);
    for (size_t i = 0; i < out.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(out[i]);
        if (c < 0x20 || c == 0x7F) out[i] = '?';
    }
    return out;
}

// Returns 0 or the errno of the failed write
int write_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        off += static_cast<size_t>(n);
    }
    return 0;
}

// Entry names of an open directory, without "." and ".."
Result<std::vector<std::string>> read_names(int dirfd) {
    typedef Result<std::vector<std::string>> R;

    // Separate descriptor so the caller's handle keeps its own offset
    int fd = openat(dirfd, ".", kDirFlags);
    if (fd < 0) {
        return R::fail(error_from_errno(errno, "reopen directory"));
    }
    DIR* raw = fdopendir(fd);
    if (!raw) {
        int err = errno;
        close(fd);
        return R::fail(error_from_errno(err, "fdopendir"));
    }
    DirPtr dir(raw);

    std::vector<std::string> names;
    errno = 0;
    struct dirent* entry;
    while ((entry = readdir(dir.get())) != nullptr) {
        std::string name = entry->d_name;
        if (name != "." && name != "..") {
            names.push_back(name);
        }
        errno = 0;
    }
    if (errno != 0) {
        return R::fail(error_from_errno(errno, "readdir"));
    }
    return R::ok(names);
}

} // namespace

// ============================================================================
// SandboxedFileService
// ============================================================================

class SandboxedFileService : public FileService {
public:
    SandboxedFileService(SandboxRoot root, const SandboxOptions& options)
        : root_(std::move(root))
        , options_(options)
        , resolver_(root_, options_) {}

    Result<std::string> read_file(const std::string& path) const override;
    Status write_file(const std::string& path, const std::string& data) const override;
    Status delete_file(const std::string& path) const override;
    Result<std::vector<std::string>> list_directory(const std::string& path) const override;
    Result<std::vector<DirEntry>> list_entries(const std::string& path) const override;
    Status create_directory(const std::string& path) const override;
    Status delete_directory(const std::string& path, bool recursive) const override;
    Result<bool> exists(const std::string& path) const override;
    Result<uint64_t> size(const std::string& path) const override;
    Status create_symlink(const std::string& target, const std::string& link_path) const override;

    const std::string& root_path() const override { return root_.path; }

private:
    SandboxedFileService(const SandboxedFileService&) = delete;
    SandboxedFileService& operator=(const SandboxedFileService&) = delete;

    SandboxError report(const char* op, const std::string& raw, const SandboxError& err) const;
    Result<ResolvedPath> resolve_for(const char* op, const std::string& raw) const;

    // Opens root/segments[0..count) as directories, by handle
    Result<UniqueFd> open_directory_chain(const ResolvedPath& path, size_t count) const;

    // lstat-equivalent of name inside dirfd plus the link-class policy
    Status stat_entry(int dirfd, const ResolvedPath& path, struct stat& st) const;

    Result<std::vector<DirEntry>> scan_directory(const char* op, const std::string& raw) const;
    Status remove_tree(int dirfd, size_t depth) const;

    SandboxRoot root_;
    SandboxOptions options_;
    SandboxResolver resolver_;
};

SandboxError SandboxedFileService::report(const char* op, const std::string& raw,
                                          const SandboxError& err) const {
    if (is_security_violation(err.kind) || err.kind == ErrorKind::OperationForbidden) {
        LOG_WARN("[Sandbox] %s '%s' denied (root %s): %s",
                 op, printable(raw).c_str(), root_.path.c_str(), err.describe().c_str());
    } else if (err.kind == ErrorKind::IoError) {
        LOG_ERROR("[Sandbox] %s '%s' failed: %s", op, printable(raw).c_str(), err.describe().c_str());
    } else {
        LOG_DEBUG("[Sandbox] %s '%s': %s", op, printable(raw).c_str(), err.describe().c_str());
    }
    return err;
}

Result<ResolvedPath> SandboxedFileService::resolve_for(const char* op, const std::string& raw) const {
    Result<ResolvedPath> r = resolver_.resolve(raw);
    if (!r.success) {
        report(op, raw, r.error);
        return r;
    }

    LOG_DEBUG("[Sandbox] %s '%s' -> %s", op, printable(raw).c_str(), r.value.absolute.c_str());

    if (options_.pre_io_hook) {
        options_.pre_io_hook(r.value);
    }
    return r;
}

Result<UniqueFd> SandboxedFileService::open_directory_chain(const ResolvedPath& path,
                                                            size_t count) const {
    typedef Result<UniqueFd> R;

    UniqueFd current(openat(root_.fd.get(), ".", kDirFlags));
    if (!current.valid()) {
        return R::fail(error_from_errno(errno, "open sandbox root"));
    }

    const std::vector<std::string>& segs = path.relative.segments;
    std::string rel;
    for (size_t i = 0; i < count && i < segs.size(); ++i) {
        const std::string& seg = segs[i];
        rel += (i == 0 ? "" : "/") + seg;

        int fd = openat(current.get(), seg.c_str(), kDirFlags);
        if (fd < 0) {
            int err = errno;
            struct stat st;
            if ((err == ELOOP || err == ENOTDIR) &&
                fstatat(current.get(), seg.c_str(), &st, AT_SYMLINK_NOFOLLOW) == 0) {
                std::string violation = link_class_violation(st, root_.dev, options_);
                if (S_ISLNK(st.st_mode) || (!violation.empty() && !S_ISREG(st.st_mode))) {
                    return R::fail(ErrorKind::SymbolicLinkRejected,
                                   violation + " at '" + rel + "'");
                }
                if (!S_ISDIR(st.st_mode)) {
                    if (i + 1 == segs.size()) {
                        return R::fail(ErrorKind::IoError, "'" + rel + "' is not a directory");
                    }
                    return R::fail(ErrorKind::NotFound, "'" + rel + "' is not a directory");
                }
            }
            if (err == ENOTDIR) {
                return R::fail(ErrorKind::NotFound, "'" + rel + "' is not a directory");
            }
            return R::fail(error_from_errno(err, "open '" + rel + "'"));
        }

        UniqueFd next(fd);
        struct stat st;
        if (fstat(next.get(), &st) != 0) {
            return R::fail(error_from_errno(errno, "fstat '" + rel + "'"));
        }
        std::string violation = link_class_violation(st, root_.dev, options_);
        if (!violation.empty()) {
            return R::fail(ErrorKind::SymbolicLinkRejected, violation + " at '" + rel + "'");
        }
        current = std::move(next);
    }

    return R::ok(std::move(current));
}

Status SandboxedFileService::stat_entry(int dirfd, const ResolvedPath& path, struct stat& st) const {
    const std::string rel = path.relative.to_string();
    if (fstatat(dirfd, path.name().c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0) {
        return Status::fail(error_from_errno(errno, "stat '" + rel + "'"));
    }
    std::string violation = link_class_violation(st, root_.dev, options_);
    if (!violation.empty()) {
        return Status::fail(ErrorKind::SymbolicLinkRejected, violation + " at '" + rel + "'");
    }
    return Status::ok();
}

// ============================================================================
// Operations
// ============================================================================

Result<std::string> SandboxedFileService::read_file(const std::string& raw) const {
    typedef Result<std::string> R;
    const char* op = "read";

    Result<ResolvedPath> r = resolve_for(op, raw);
    if (!r.success) return R::fail(r.error);
    const ResolvedPath& path = r.value;
    const std::string rel = path.relative.to_string();

    if (path.is_root()) {
        return R::fail(report(op, raw, SandboxError(ErrorKind::IoError, "'.' is a directory")));
    }

    Result<UniqueFd> parent = open_directory_chain(path, path.relative.segments.size() - 1);
    if (!parent.success) return R::fail(report(op, raw, parent.error));

    struct stat before;
    Status s = stat_entry(parent.value.get(), path, before);
    if (!s.success) return R::fail(report(op, raw, s.error));
    if (S_ISDIR(before.st_mode)) {
        return R::fail(report(op, raw, SandboxError(ErrorKind::IoError, "'" + rel + "' is a directory")));
    }

    UniqueFd fd(openat(parent.value.get(), path.name().c_str(),
                       O_RDONLY | O_NOFOLLOW | O_NOCTTY | O_NONBLOCK | O_CLOEXEC));
    if (!fd.valid()) {
        return R::fail(report(op, raw, error_from_errno(errno, "open '" + rel + "'")));
    }

    struct stat st;
    if (fstat(fd.get(), &st) != 0) {
        return R::fail(report(op, raw, error_from_errno(errno, "fstat '" + rel + "'")));
    }
    if (st.st_dev != before.st_dev || st.st_ino != before.st_ino || !S_ISREG(st.st_mode)) {
        return R::fail(report(op, raw, SandboxError(ErrorKind::IoError,
                                                    "'" + rel + "' changed while opening")));
    }
    if (static_cast<uint64_t>(st.st_size) > options_.max_read_bytes) {
        return R::fail(report(op, raw, SandboxError(ErrorKind::IoError,
            "'" + rel + "' is larger than " + std::to_string(options_.max_read_bytes) + " bytes")));
    }

    std::string content;
    content.reserve(static_cast<size_t>(st.st_size));
    char buf[65536];
    for (;;) {
        ssize_t n = read(fd.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            return R::fail(report(op, raw, error_from_errno(errno, "read '" + rel + "'")));
        }
        if (n == 0) break;
        content.append(buf, static_cast<size_t>(n));
        if (content.size() > options_.max_read_bytes) {
            return R::fail(report(op, raw, SandboxError(ErrorKind::IoError,
                                                        "'" + rel + "' grew past the read limit")));
        }
    }

    LOG_DEBUG("[Sandbox] read '%s' (%zu bytes)", rel.c_str(), content.size());
    return R::ok(content);
}

Status SandboxedFileService::write_file(const std::string& raw, const std::string& data) const {
    const char* op = "write";

    Result<ResolvedPath> r = resolve_for(op, raw);
    if (!r.success) return Status::fail(r.error);
    const ResolvedPath& path = r.value;
    const std::string rel = path.relative.to_string();

    if (path.is_root()) {
        return Status::fail(report(op, raw, SandboxError(ErrorKind::IoError, "'.' is a directory")));
    }

    Result<UniqueFd> parent = open_directory_chain(path, path.relative.segments.size() - 1);
    if (!parent.success) return Status::fail(report(op, raw, parent.error));
    const int pfd = parent.value.get();
    const std::string& name = path.name();

    bool replacing = false;
    mode_t mode = 0;
    struct stat st;
    if (fstatat(pfd, name.c_str(), &st, AT_SYMLINK_NOFOLLOW) == 0) {
        std::string violation = link_class_violation(st, root_.dev, options_);
        if (!violation.empty()) {
            return Status::fail(report(op, raw, SandboxError(ErrorKind::SymbolicLinkRejected,
                                                             violation + " at '" + rel + "'")));
        }
        if (S_ISDIR(st.st_mode)) {
            return Status::fail(report(op, raw, SandboxError(ErrorKind::IoError,
                                                             "'" + rel + "' is a directory")));
        }
        replacing = true;
        mode = st.st_mode & 0777;
    } else if (errno != ENOENT) {
        return Status::fail(report(op, raw, error_from_errno(errno, "stat '" + rel + "'")));
    }

    std::string token = random_hex(16);
    if (token.empty()) {
        return Status::fail(report(op, raw, SandboxError(ErrorKind::IoError,
                                                         "random source unavailable")));
    }
    const std::string tmp = ".pathjail-" + token + ".tmp";

    UniqueFd out(openat(pfd, tmp.c_str(),
                        O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0644));
    if (!out.valid()) {
        return Status::fail(report(op, raw, error_from_errno(errno, "create temp for '" + rel + "'")));
    }

    int err = write_all(out.get(), data);
    if (err == 0 && replacing && fchmod(out.get(), mode) != 0) err = errno;
    if (err == 0 && fsync(out.get()) != 0) err = errno;
    if (err == 0 && close(out.release()) != 0) err = errno;
    // renameat replaces a link at the target instead of writing through it
    if (err == 0 && renameat(pfd, tmp.c_str(), pfd, name.c_str()) != 0) err = errno;

    if (err != 0) {
        out.reset();
        if (unlinkat(pfd, tmp.c_str(), 0) != 0 && errno != ENOENT) {
            LOG_WARN("[Sandbox] could not remove temp file %s in '%s': %s",
                     tmp.c_str(), rel.c_str(), strerror(errno));
        }
        if (err == EISDIR) {
            return Status::fail(report(op, raw, SandboxError(ErrorKind::IoError,
                                                             "'" + rel + "' is a directory")));
        }
        return Status::fail(report(op, raw, error_from_errno(err, "write '" + rel + "'")));
    }

    LOG_DEBUG("[Sandbox] wrote '%s' (%zu bytes)", rel.c_str(), data.size());
    return Status::ok();
}

Status SandboxedFileService::delete_file(const std::string& raw) const {
    const char* op = "delete";

    Result<ResolvedPath> r = resolve_for(op, raw);
    if (!r.success) return Status::fail(r.error);
    const ResolvedPath& path = r.value;
    const std::string rel = path.relative.to_string();

    if (path.is_root()) {
        return Status::fail(report(op, raw, SandboxError(ErrorKind::OperationForbidden,
                                                         "refusing to delete the sandbox root")));
    }

    Result<UniqueFd> parent = open_directory_chain(path, path.relative.segments.size() - 1);
    if (!parent.success) return Status::fail(report(op, raw, parent.error));

    struct stat st;
    Status s = stat_entry(parent.value.get(), path, st);
    if (!s.success) return Status::fail(report(op, raw, s.error));
    if (S_ISDIR(st.st_mode)) {
        return Status::fail(report(op, raw, SandboxError(ErrorKind::IoError,
                                                         "'" + rel + "' is a directory")));
    }

    // unlinkat removes a link swapped in meanwhile, never its target
    if (unlinkat(parent.value.get(), path.name().c_str(), 0) != 0) {
        return Status::fail(report(op, raw, error_from_errno(errno, "unlink '" + rel + "'")));
    }

    LOG_DEBUG("[Sandbox] deleted '%s'", rel.c_str());
    return Status::ok();
}

Result<std::vector<DirEntry>> SandboxedFileService::scan_directory(const char* op,
                                                                   const std::string& raw) const {
    typedef Result<std::vector<DirEntry>> R;

    Result<ResolvedPath> r = resolve_for(op, raw);
    if (!r.success) return R::fail(r.error);
    const ResolvedPath& path = r.value;

    Result<UniqueFd> dir = open_directory_chain(path, path.relative.segments.size());
    if (!dir.success) return R::fail(report(op, raw, dir.error));

    Result<std::vector<std::string>> names = read_names(dir.value.get());
    if (!names.success) return R::fail(report(op, raw, names.error));

    std::vector<DirEntry> entries;
    size_t skipped = 0;
    for (size_t i = 0; i < names.value.size(); ++i) {
        const std::string& name = names.value[i];
        struct stat st;
        if (fstatat(dir.value.get(), name.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0) {
            if (errno == ENOENT) continue;  // removed while listing
            return R::fail(report(op, raw, error_from_errno(errno, "stat entry")));
        }
        if (!link_class_violation(st, root_.dev, options_).empty()) {
            ++skipped;
            continue;
        }

        DirEntry entry;
        entry.name = name;
        entry.is_directory = S_ISDIR(st.st_mode);
        entry.size = entry.is_directory ? 0 : static_cast<uint64_t>(st.st_size);
        entries.push_back(entry);
    }

    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });

    LOG_DEBUG("[Sandbox] listed '%s': %zu entries, %zu link-class entries hidden",
              path.relative.to_string().c_str(), entries.size(), skipped);
    return R::ok(entries);
}

Result<std::vector<std::string>> SandboxedFileService::list_directory(const std::string& raw) const {
    typedef Result<std::vector<std::string>> R;

    Result<std::vector<DirEntry>> entries = scan_directory("list", raw);
    if (!entries.success) return R::fail(entries.error);

    std::vector<std::string> names;
    names.reserve(entries.value.size());
    for (size_t i = 0; i < entries.value.size(); ++i) {
        names.push_back(entries.value[i].name);
    }
    return R::ok(names);
}

Result<std::vector<DirEntry>> SandboxedFileService::list_entries(const std::string& raw) const {
    return scan_directory("list", raw);
}

Status SandboxedFileService::create_directory(const std::string& raw) const {
    const char* op = "mkdir";

    Result<ResolvedPath> r = resolve_for(op, raw);
    if (!r.success) return Status::fail(r.error);
    const ResolvedPath& path = r.value;
    const std::string rel = path.relative.to_string();

    if (path.is_root()) {
        return Status::fail(report(op, raw, SandboxError(ErrorKind::AlreadyExists,
                                                         "the sandbox root exists")));
    }

    Result<UniqueFd> parent = open_directory_chain(path, path.relative.segments.size() - 1);
    if (!parent.success) return Status::fail(report(op, raw, parent.error));

    if (mkdirat(parent.value.get(), path.name().c_str(), 0755) != 0) {
        return Status::fail(report(op, raw, error_from_errno(errno, "mkdir '" + rel + "'")));
    }

    LOG_DEBUG("[Sandbox] created directory '%s'", rel.c_str());
    return Status::ok();
}

Status SandboxedFileService::remove_tree(int dirfd, size_t depth) const {
    if (depth > options_.max_segments) {
        return Status::fail(ErrorKind::IoError, "directory tree too deep");
    }

    Result<std::vector<std::string>> names = read_names(dirfd);
    if (!names.success) return Status::fail(names.error);

    for (size_t i = 0; i < names.value.size(); ++i) {
        const char* name = names.value[i].c_str();
        struct stat st;
        if (fstatat(dirfd, name, &st, AT_SYMLINK_NOFOLLOW) != 0) {
            if (errno == ENOENT) continue;
            return Status::fail(error_from_errno(errno, "stat entry"));
        }

        if (S_ISDIR(st.st_mode)) {
            if (!options_.allow_mount_crossing && st.st_dev != root_.dev) {
                return Status::fail(ErrorKind::SymbolicLinkRejected, "mount point inside tree");
            }
            UniqueFd child(openat(dirfd, name, kDirFlags));
            if (!child.valid()) {
                return Status::fail(error_from_errno(errno, "open subdirectory"));
            }
            Status s = remove_tree(child.get(), depth + 1);
            if (!s.success) return s;
            child.reset();
            if (unlinkat(dirfd, name, AT_REMOVEDIR) != 0 && errno != ENOENT) {
                return Status::fail(error_from_errno(errno, "rmdir entry"));
            }
        } else {
            // Files, links and special files: the entry goes, a link target is untouched
            if (unlinkat(dirfd, name, 0) != 0 && errno != ENOENT) {
                return Status::fail(error_from_errno(errno, "unlink entry"));
            }
        }
    }
    return Status::ok();
}

Status SandboxedFileService::delete_directory(const std::string& raw, bool recursive) const {
    const char* op = recursive ? "rmdir -r" : "rmdir";

    Result<ResolvedPath> r = resolve_for(op, raw);
    if (!r.success) return Status::fail(r.error);
    const ResolvedPath& path = r.value;
    const std::string rel = path.relative.to_string();

    if (path.is_root()) {
        return Status::fail(report(op, raw, SandboxError(ErrorKind::OperationForbidden,
                                                         "refusing to delete the sandbox root")));
    }

    Result<UniqueFd> parent = open_directory_chain(path, path.relative.segments.size() - 1);
    if (!parent.success) return Status::fail(report(op, raw, parent.error));
    const int pfd = parent.value.get();

    struct stat st;
    Status s = stat_entry(pfd, path, st);
    if (!s.success) return Status::fail(report(op, raw, s.error));
    if (!S_ISDIR(st.st_mode)) {
        return Status::fail(report(op, raw, SandboxError(ErrorKind::IoError,
                                                         "'" + rel + "' is not a directory")));
    }

    if (recursive) {
        UniqueFd dir(openat(pfd, path.name().c_str(), kDirFlags));
        if (!dir.valid()) {
            return Status::fail(report(op, raw, error_from_errno(errno, "open '" + rel + "'")));
        }
        struct stat opened;
        if (fstat(dir.get(), &opened) != 0) {
            return Status::fail(report(op, raw, error_from_errno(errno, "fstat '" + rel + "'")));
        }
        if (opened.st_dev != st.st_dev || opened.st_ino != st.st_ino) {
            return Status::fail(report(op, raw, SandboxError(ErrorKind::IoError,
                                                             "'" + rel + "' changed while opening")));
        }
        Status cleared = remove_tree(dir.get(), 1);
        if (!cleared.success) return Status::fail(report(op, raw, cleared.error));
    }

    if (unlinkat(pfd, path.name().c_str(), AT_REMOVEDIR) != 0) {
        int err = errno;
        if (err == EEXIST) err = ENOTEMPTY;
        return Status::fail(report(op, raw, error_from_errno(err, "rmdir '" + rel + "'")));
    }

    LOG_DEBUG("[Sandbox] removed directory '%s'", rel.c_str());
    return Status::ok();
}

Result<bool> SandboxedFileService::exists(const std::string& raw) const {
    typedef Result<bool> R;
    const char* op = "exists";

    Result<ResolvedPath> r = resolve_for(op, raw);
    if (!r.success) return R::fail(r.error);
    const ResolvedPath& path = r.value;

    if (path.is_root()) return R::ok(true);

    Result<UniqueFd> parent = open_directory_chain(path, path.relative.segments.size() - 1);
    if (!parent.success) {
        if (parent.error.kind == ErrorKind::NotFound) return R::ok(false);
        return R::fail(report(op, raw, parent.error));
    }

    struct stat st;
    Status s = stat_entry(parent.value.get(), path, st);
    if (!s.success) {
        if (s.error.kind == ErrorKind::NotFound) return R::ok(false);
        return R::fail(report(op, raw, s.error));
    }
    return R::ok(true);
}

Result<uint64_t> SandboxedFileService::size(const std::string& raw) const {
    typedef Result<uint64_t> R;
    const char* op = "size";

    Result<ResolvedPath> r = resolve_for(op, raw);
    if (!r.success) return R::fail(r.error);
    const ResolvedPath& path = r.value;
    const std::string rel = path.relative.to_string();

    if (path.is_root()) {
        return R::fail(report(op, raw, SandboxError(ErrorKind::IoError, "'.' is a directory")));
    }

    Result<UniqueFd> parent = open_directory_chain(path, path.relative.segments.size() - 1);
    if (!parent.success) return R::fail(report(op, raw, parent.error));

    struct stat st;
    Status s = stat_entry(parent.value.get(), path, st);
    if (!s.success) return R::fail(report(op, raw, s.error));
    if (S_ISDIR(st.st_mode)) {
        return R::fail(report(op, raw, SandboxError(ErrorKind::IoError,
                                                    "'" + rel + "' is a directory")));
    }
    return R::ok(static_cast<uint64_t>(st.st_size));
}

Status SandboxedFileService::create_symlink(const std::string& target,
                                            const std::string& link_path) const {
    LOG_WARN("[Sandbox] symlink '%s' -> '%s' refused: link creation is disabled",
             printable(link_path).c_str(), printable(target).c_str());
    return Status::fail(ErrorKind::OperationForbidden, "symbolic link creation is disabled");
}

// ============================================================================
// Factory
// ============================================================================

Result<std::unique_ptr<FileService>> open_sandbox(const std::string& root_dir,
                                                  const SandboxOptions& options) {
    typedef Result<std::unique_ptr<FileService>> R;

    Result<SandboxRoot> root = open_sandbox_root(root_dir);
    if (!root.success) {
        LOG_ERROR("[Sandbox] Cannot use %s as sandbox root: %s",
                  root_dir.c_str(), root.error.describe().c_str());
        return R::fail(root.error);
    }

    LOG_INFO("[Sandbox] Root: %s", root.value.path.c_str());
    LOG_DEBUG("[Sandbox]   max_path_length=%zu max_segments=%zu max_segment_length=%zu",
              options.max_path_length, options.max_segments, options.max_segment_length);
    LOG_DEBUG("[Sandbox]   reject_hardlinks=%s allow_mount_crossing=%s",
              options.reject_hardlinks ? "yes" : "no",
              options.allow_mount_crossing ? "yes" : "no");

    std::unique_ptr<FileService> service(
        new SandboxedFileService(std::move(root.value), options));
    return R::ok(std::move(service));
}

} // namespace pathjail
