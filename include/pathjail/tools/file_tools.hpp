/*
 * pathjail C++17 - File tool handler
 *
 * JSON front for calling layers (API handlers, UI controllers):
 *
 *   request:  {"action": "read", "params": {"path": "notes/today.txt"}}
 *   success:  {"success": true,  "output": ...}
 *   failure:  {"success": false, "error": {"error": "access denied",
 *                                          "code": "AccessDenied", "status": 403}}
 *
 * Failures only ever carry the redacted public view of the error; the
 * full detail stays in the server log.
 */
#ifndef pathjail_TOOLS_FILE_TOOLS_HPP
#define pathjail_TOOLS_FILE_TOOLS_HPP

#include <pathjail/core/config.hpp>
#include <pathjail/core/error.hpp>
#include <pathjail/core/json.hpp>
#include <pathjail/sandbox/file_service.hpp>

#include <string>
#include <vector>

namespace pathjail {

struct ToolResult {
    bool success;
    Json output;
    SandboxError error;

    ToolResult() : success(false) {}

    static ToolResult ok(const Json& output) {
        ToolResult r;
        r.success = true;
        r.output = output;
        return r;
    }

    static ToolResult fail(const SandboxError& err) {
        ToolResult r;
        r.error = err;
        return r;
    }

    Json to_json() const;
};

class FileToolHandler {
public:
    // service must outlive the handler
    FileToolHandler(const FileService& service, const Config& cfg);

    // read, write, delete, list_dir, mkdir, rmdir, exists, size, symlink
    std::vector<std::string> actions() const;

    ToolResult execute(const std::string& action, const Json& params) const;

    // {"action": ..., "params": {...}}
    ToolResult execute_request(const Json& request) const;

private:
    ToolResult do_read(const Json& params) const;
    ToolResult do_write(const Json& params) const;
    ToolResult do_delete(const Json& params) const;
    ToolResult do_list_dir(const Json& params) const;
    ToolResult do_mkdir(const Json& params) const;
    ToolResult do_rmdir(const Json& params) const;
    ToolResult do_exists(const Json& params) const;
    ToolResult do_size(const Json& params) const;
    ToolResult do_symlink(const Json& params) const;

    const FileService& service_;
    size_t max_output_bytes_;
};

} // namespace pathjail

#endif // pathjail_TOOLS_FILE_TOOLS_HPP
