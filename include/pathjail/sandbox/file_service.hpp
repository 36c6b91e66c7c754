/*
 * pathjail C++17 - Sandboxed File Service
 *
 * The only door into the filesystem for application code. Every call takes
 * a caller-supplied relative path, revalidates it from scratch and then
 * performs the I/O relative to directory handles opened with O_NOFOLLOW,
 * so a component swapped for a link after validation makes the call fail
 * instead of following it.
 *
 * Instances are immutable after open_sandbox() and safe to share between
 * threads. Operations on the same path are not serialized.
 */
#ifndef pathjail_SANDBOX_FILE_SERVICE_HPP
#define pathjail_SANDBOX_FILE_SERVICE_HPP

#include <pathjail/core/error.hpp>
#include <pathjail/sandbox/options.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pathjail {

struct DirEntry {
    std::string name;
    bool is_directory;
    uint64_t size;      // 0 for directories

    DirEntry() : is_directory(false), size(0) {}
};

class FileService {
public:
    virtual ~FileService() {}

    // Whole file contents. NotFound, IoError (directory, too large), sandbox kinds.
    virtual Result<std::string> read_file(const std::string& path) const = 0;

    // Atomically replaces the file. The parent directory must exist.
    virtual Status write_file(const std::string& path, const std::string& data) const = 0;

    virtual Status delete_file(const std::string& path) const = 0;

    // Entry names sorted by byte value; links and special files are left out
    virtual Result<std::vector<std::string>> list_directory(const std::string& path) const = 0;
    virtual Result<std::vector<DirEntry>> list_entries(const std::string& path) const = 0;

    // Parents are not created
    virtual Status create_directory(const std::string& path) const = 0;

    // Without recursive the directory must be empty (NotEmpty otherwise).
    // Links inside a recursively deleted tree are removed, never followed.
    virtual Status delete_directory(const std::string& path, bool recursive) const = 0;

    // True for an existing regular file or directory
    virtual Result<bool> exists(const std::string& path) const = 0;

    // Byte size of a regular file
    virtual Result<uint64_t> size(const std::string& path) const = 0;

    // Always OperationForbidden
    virtual Status create_symlink(const std::string& target, const std::string& link_path) const = 0;

    // Canonical root, for host-side logging only. Never show it to users.
    virtual const std::string& root_path() const = 0;
};

// Opens the sandbox rooted at root_dir. Fails when root_dir is missing,
// not a directory, or a symbolic link.
Result<std::unique_ptr<FileService>> open_sandbox(const std::string& root_dir,
                                                  const SandboxOptions& options);

} // namespace pathjail

#endif // pathjail_SANDBOX_FILE_SERVICE_HPP
