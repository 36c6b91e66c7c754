/*
 * pathjail C++17 - Sandboxed file access from the command line
 *
 * Usage:
 *   ./pathjail [options] <action> [args...]
 *   ./pathjail [options] --json '{"action": "read", "params": {"path": "a.txt"}}'
 *
 * The sandbox root comes from --root or "sandbox.root" in the config file.
 */
#include <pathjail/core/config.hpp>
#include <pathjail/core/logger.hpp>
#include <pathjail/core/utils.hpp>
#include <pathjail/sandbox/file_service.hpp>
#include <pathjail/tools/file_tools.hpp>

#include <cstring>
#include <iostream>
#include <iterator>
#include <unistd.h>

namespace {

const char* const kName = "pathjail";
const char* const kVersion = "1.0.0";
const char* const kDefaultConfig = "pathjail.json";

enum ExitCode {
    EXIT_OK = 0,
    EXIT_FAILED = 1,
    EXIT_USAGE = 2
};

struct Options {
    std::string config_file;
    std::string root;
    std::string log_level;
    std::string json_request;
    bool recursive;
    std::vector<std::string> positional;

    Options() : recursive(false) {}
};

void print_usage(const char* prog) {
    std::cout << kName << " - sandboxed file access\n\n"
              << "Usage: " << prog << " [options] <action> [args...]\n"
              << "       " << prog << " [options] --json REQUEST\n\n"
              << "Actions:\n"
              << "  read PATH              Print a file\n"
              << "  write PATH [CONTENT]   Replace a file (stdin when CONTENT is omitted)\n"
              << "  delete PATH            Delete a file\n"
              << "  list [PATH]            List a directory\n"
              << "  mkdir PATH             Create a directory\n"
              << "  rmdir [-r] PATH        Delete a directory\n"
              << "  exists PATH            Print true or false\n"
              << "  size PATH              Print a file size in bytes\n\n"
              << "Options:\n"
              << "  -c, --config FILE      Config file (default: " << kDefaultConfig << ")\n"
              << "      --root DIR         Sandbox root (overrides sandbox.root)\n"
              << "      --log-level LEVEL  debug, info, warn or error\n"
              << "      --json REQUEST     Run one JSON request, print a JSON reply\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version\n";
}

void print_version() {
    std::cout << kName << " v" << kVersion << "\n";
}

// Returns false and sets exit_code when the program should stop
bool parse_args(int argc, char* argv[], Options& opts, int& exit_code) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            exit_code = EXIT_OK;
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            exit_code = EXIT_OK;
            return false;
        }
        if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            opts.config_file = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--root") == 0 && i + 1 < argc) {
            opts.root = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            opts.log_level = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--json") == 0 && i + 1 < argc) {
            opts.json_request = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "-r") == 0) {
            opts.recursive = true;
            continue;
        }
        opts.positional.push_back(argv[i]);
    }

    if (opts.json_request.empty() && opts.positional.empty()) {
        print_usage(argv[0]);
        exit_code = EXIT_USAGE;
        return false;
    }
    return true;
}

bool load_config(const Options& opts, pathjail::Config& cfg) {
    std::string path = opts.config_file;
    if (path.empty()) {
        if (access(kDefaultConfig, R_OK) != 0) {
            return true;
        }
        path = kDefaultConfig;
    }

    std::string error;
    if (!cfg.load_file(path, error)) {
        std::cerr << kName << ": " << error << "\n";
        return false;
    }
    return true;
}

bool setup_logging(const Options& opts, const pathjail::Config& cfg) {
    std::string level_name = opts.log_level.empty() ? cfg.get_string("log_level", "info")
                                                    : opts.log_level;
    pathjail::LogLevel level;
    if (!pathjail::parse_log_level(pathjail::to_lower(level_name), level)) {
        std::cerr << kName << ": unknown log level '" << level_name << "'\n";
        return false;
    }
    pathjail::Logger::instance().set_level(level);

    std::string log_file = cfg.get_string("log_file", "");
    if (!log_file.empty() && !pathjail::Logger::instance().set_output_file(log_file)) {
        std::cerr << kName << ": cannot open log file " << log_file << "\n";
        return false;
    }
    return true;
}

// Maps positional arguments to an action name and its JSON params
bool build_request(const Options& opts, std::string& action, pathjail::Json& params) {
    const std::vector<std::string>& args = opts.positional;
    std::string verb = args[0];
    params = pathjail::Json::object();

    if (verb == "list") {
        action = "list_dir";
        params["path"] = args.size() > 1 ? args[1] : ".";
        return args.size() <= 2;
    }
    if (args.size() < 2) {
        return false;
    }
    params["path"] = args[1];

    if (verb == "read" || verb == "delete" || verb == "mkdir" ||
        verb == "exists" || verb == "size") {
        action = verb;
        return args.size() == 2;
    }
    if (verb == "rmdir") {
        action = verb;
        params["recursive"] = opts.recursive;
        return args.size() == 2;
    }
    if (verb == "write") {
        action = verb;
        if (args.size() == 3) {
            params["content"] = args[2];
        } else if (args.size() == 2) {
            std::string data((std::istreambuf_iterator<char>(std::cin)),
                             std::istreambuf_iterator<char>());
            params["content"] = pathjail::base64_encode(data);
            params["encoding"] = "base64";
        } else {
            return false;
        }
        return true;
    }
    return false;
}

void print_result(const std::string& action, const pathjail::ToolResult& result) {
    if (!result.success) {
        std::cerr << kName << ": " << result.error.public_message() << "\n";
        return;
    }

    const pathjail::Json& out = result.output;
    if (action == "read") {
        std::string content = out["content"].get<std::string>();
        if (out["encoding"] == "base64") {
            std::string decoded;
            if (pathjail::base64_decode(content, decoded)) {
                content.swap(decoded);
            }
        }
        std::cout << content;
        if (out["truncated"].get<bool>()) {
            std::cerr << kName << ": output truncated\n";
        }
    } else if (action == "list_dir") {
        const pathjail::Json& entries = out["entries"];
        for (size_t i = 0; i < entries.size(); ++i) {
            const pathjail::Json& e = entries[i];
            if (e["type"] == "directory") {
                std::cout << e["name"].get<std::string>() << "/\n";
            } else {
                std::cout << e["name"].get<std::string>()
                          << " (" << e["size"].get<uint64_t>() << " bytes)\n";
            }
        }
    } else if (action == "exists") {
        std::cout << (out["exists"].get<bool>() ? "true" : "false") << "\n";
    } else if (action == "size") {
        std::cout << out["size"].get<uint64_t>() << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    int exit_code = EXIT_OK;
    if (!parse_args(argc, argv, opts, exit_code)) {
        return exit_code;
    }

    pathjail::Config cfg;
    if (!load_config(opts, cfg) || !setup_logging(opts, cfg)) {
        return EXIT_USAGE;
    }

    std::string root = opts.root.empty() ? cfg.get_string("sandbox.root", "") : opts.root;
    if (root.empty()) {
        std::cerr << kName << ": no sandbox root (use --root or sandbox.root)\n";
        return EXIT_USAGE;
    }

    pathjail::Result<std::unique_ptr<pathjail::FileService>> sandbox =
        pathjail::open_sandbox(root, pathjail::SandboxOptions::from_config(cfg));
    if (!sandbox.success) {
        std::cerr << kName << ": cannot open sandbox root: "
                  << sandbox.error.public_message() << "\n";
        return EXIT_USAGE;
    }

    pathjail::FileToolHandler tools(*sandbox.value, cfg);

    if (!opts.json_request.empty()) {
        pathjail::Json request = pathjail::Json::parse(opts.json_request, nullptr, false);
        if (request.is_discarded() || !request.is_object()) {
            std::cerr << kName << ": --json expects a JSON object\n";
            return EXIT_USAGE;
        }
        pathjail::ToolResult result = tools.execute_request(request);
        std::cout << result.to_json().dump(2, ' ', false, pathjail::Json::error_handler_t::replace)
                  << "\n";
        return result.success ? EXIT_OK : EXIT_FAILED;
    }

    std::string action;
    pathjail::Json params;
    if (opts.positional[0] == "symlink") {
        // Accepted on the command line only to be refused like any other caller
        action = "symlink";
        params["target"] = opts.positional.size() > 1 ? opts.positional[1] : "";
        params["path"] = opts.positional.size() > 2 ? opts.positional[2] : "";
    } else if (!build_request(opts, action, params)) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    pathjail::ToolResult result = tools.execute(action, params);
    print_result(action, result);
    return result.success ? EXIT_OK : EXIT_FAILED;
}
