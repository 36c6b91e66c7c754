/*
 * pathjail C++17 - File tool handler implementation
 */
#include <pathjail/tools/file_tools.hpp>
#include <pathjail/core/logger.hpp>
#include <pathjail/core/utils.hpp>

namespace pathjail {

namespace {

const int64_t kDefaultMaxOutputBytes = 50000;

bool get_string_param(const Json& params, const char* key, std::string& out) {
    if (!params.is_object() || !params.contains(key) || !params[key].is_string()) {
        return false;
    }
    out = params[key].get<std::string>();
    return true;
}

ToolResult missing(const char* key) {
    return ToolResult::fail(SandboxError(ErrorKind::InvalidPath,
                                         std::string("missing required parameter: ") + key));
}

} // namespace

Json ToolResult::to_json() const {
    Json j;
    j["success"] = success;
    if (success) {
        j["output"] = output;
    } else {
        j["error"] = error.to_public_json();
    }
    return j;
}

FileToolHandler::FileToolHandler(const FileService& service, const Config& cfg)
    : service_(service)
    , max_output_bytes_(static_cast<size_t>(kDefaultMaxOutputBytes))
{
    int64_t limit = cfg.get_int("tools.max_output_bytes", kDefaultMaxOutputBytes);
    if (limit > 0) {
        max_output_bytes_ = static_cast<size_t>(limit);
    }
}

std::vector<std::string> FileToolHandler::actions() const {
    std::vector<std::string> acts;
    acts.push_back("read");
    acts.push_back("write");
    acts.push_back("delete");
    acts.push_back("list_dir");
    acts.push_back("mkdir");
    acts.push_back("rmdir");
    acts.push_back("exists");
    acts.push_back("size");
    acts.push_back("symlink");
    return acts;
}

ToolResult FileToolHandler::execute(const std::string& action, const Json& params) const {
    ToolResult result;

    if (action == "read") {
        result = do_read(params);
    } else if (action == "write") {
        result = do_write(params);
    } else if (action == "delete") {
        result = do_delete(params);
    } else if (action == "list_dir") {
        result = do_list_dir(params);
    } else if (action == "mkdir") {
        result = do_mkdir(params);
    } else if (action == "rmdir") {
        result = do_rmdir(params);
    } else if (action == "exists") {
        result = do_exists(params);
    } else if (action == "size") {
        result = do_size(params);
    } else if (action == "symlink") {
        result = do_symlink(params);
    } else {
        LOG_WARN("[Tools] unknown action '%s'", truncate_safe(action, 64).c_str());
        return ToolResult::fail(SandboxError(ErrorKind::OperationForbidden,
                                             "unknown action: " + action));
    }

    if (!result.success) {
        LOG_DEBUG("[Tools] %s failed: %s", action.c_str(), result.error.describe().c_str());
    }
    return result;
}

ToolResult FileToolHandler::execute_request(const Json& request) const {
    std::string action;
    if (!get_string_param(request, "action", action)) {
        return ToolResult::fail(SandboxError(ErrorKind::OperationForbidden,
                                             "request has no action"));
    }
    Json params = Json::object();
    if (request.contains("params")) {
        params = request["params"];
    }
    return execute(action, params);
}

// ============================================================================
// Actions
// ============================================================================

ToolResult FileToolHandler::do_read(const Json& params) const {
    std::string path;
    if (!get_string_param(params, "path", path)) return missing("path");

    Result<std::string> r = service_.read_file(path);
    if (!r.success) return ToolResult::fail(r.error);

    const std::string& content = r.value;
    bool truncated = content.size() > max_output_bytes_;

    Json out;
    out["size"] = content.size();
    out["truncated"] = truncated;
    if (is_valid_utf8(content)) {
        out["encoding"] = "utf-8";
        out["content"] = truncated ? truncate_safe(content, max_output_bytes_) : content;
    } else {
        out["encoding"] = "base64";
        out["content"] = base64_encode(truncated ? content.substr(0, max_output_bytes_) : content);
    }
    return ToolResult::ok(out);
}

ToolResult FileToolHandler::do_write(const Json& params) const {
    std::string path;
    std::string content;
    if (!get_string_param(params, "path", path)) return missing("path");
    if (!get_string_param(params, "content", content)) return missing("content");

    std::string encoding = "utf-8";
    get_string_param(params, "encoding", encoding);
    if (encoding == "base64") {
        std::string decoded;
        if (!base64_decode(content, decoded)) {
            return ToolResult::fail(SandboxError(ErrorKind::IoError, "content is not valid base64"));
        }
        content.swap(decoded);
    } else if (encoding != "utf-8") {
        return ToolResult::fail(SandboxError(ErrorKind::IoError, "unsupported encoding: " + encoding));
    }

    Status s = service_.write_file(path, content);
    if (!s.success) return ToolResult::fail(s.error);

    Json out;
    out["bytes_written"] = content.size();
    return ToolResult::ok(out);
}

ToolResult FileToolHandler::do_delete(const Json& params) const {
    std::string path;
    if (!get_string_param(params, "path", path)) return missing("path");

    Status s = service_.delete_file(path);
    if (!s.success) return ToolResult::fail(s.error);
    return ToolResult::ok(Json::object());
}

ToolResult FileToolHandler::do_list_dir(const Json& params) const {
    std::string path = ".";
    get_string_param(params, "path", path);

    Result<std::vector<DirEntry>> r = service_.list_entries(path);
    if (!r.success) return ToolResult::fail(r.error);

    Json entries = Json::array();
    for (size_t i = 0; i < r.value.size(); ++i) {
        const DirEntry& e = r.value[i];
        Json item;
        item["name"] = e.name;
        item["type"] = e.is_directory ? "directory" : "file";
        item["size"] = e.size;
        entries.push_back(item);
    }

    Json out;
    out["entries"] = entries;
    return ToolResult::ok(out);
}

ToolResult FileToolHandler::do_mkdir(const Json& params) const {
    std::string path;
    if (!get_string_param(params, "path", path)) return missing("path");

    Status s = service_.create_directory(path);
    if (!s.success) return ToolResult::fail(s.error);
    return ToolResult::ok(Json::object());
}

ToolResult FileToolHandler::do_rmdir(const Json& params) const {
    std::string path;
    if (!get_string_param(params, "path", path)) return missing("path");

    bool recursive = false;
    if (params.contains("recursive") && params["recursive"].is_boolean()) {
        recursive = params["recursive"].get<bool>();
    }

    Status s = service_.delete_directory(path, recursive);
    if (!s.success) return ToolResult::fail(s.error);
    return ToolResult::ok(Json::object());
}

ToolResult FileToolHandler::do_exists(const Json& params) const {
    std::string path;
    if (!get_string_param(params, "path", path)) return missing("path");

    Result<bool> r = service_.exists(path);
    if (!r.success) return ToolResult::fail(r.error);

    Json out;
    out["exists"] = r.value;
    return ToolResult::ok(out);
}

ToolResult FileToolHandler::do_size(const Json& params) const {
    std::string path;
    if (!get_string_param(params, "path", path)) return missing("path");

    Result<uint64_t> r = service_.size(path);
    if (!r.success) return ToolResult::fail(r.error);

    Json out;
    out["size"] = r.value;
    return ToolResult::ok(out);
}

ToolResult FileToolHandler::do_symlink(const Json& params) const {
    std::string target;
    std::string path;
    get_string_param(params, "target", target);
    get_string_param(params, "path", path);

    Status s = service_.create_symlink(target, path);
    if (!s.success) return ToolResult::fail(s.error);
    return ToolResult::ok(Json::object());
}

} // namespace pathjail
