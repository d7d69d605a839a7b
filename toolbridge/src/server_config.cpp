#include "server_config.hpp"

#include <cstring>
#include <limits>
#include <sstream>

namespace toolbridge {

namespace {

// Matches "--name value" and "--name=value"; advances i past a consumed value.
bool take_option(const char* name, int argc, char** argv, int& i, std::string& value) {
    const size_t len = std::strlen(name);
    if (std::strcmp(argv[i], name) == 0) {
        if (i + 1 >= argc) {
            throw ConfigError(std::string(name) + " requires a value");
        }
        value = argv[++i];
        return true;
    }
    if (std::strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        value = argv[i] + len + 1;
        return true;
    }
    return false;
}

size_t parse_count(const std::string& option, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError(option + " expects a non-negative integer, got '" + value + "'");
    }
    try {
        unsigned long long parsed = std::stoull(value);
        if (parsed > std::numeric_limits<size_t>::max()) {
            throw ConfigError(option + " is out of range");
        }
        return static_cast<size_t>(parsed);
    } catch (const std::out_of_range&) {
        throw ConfigError(option + " is out of range");
    }
}

} // namespace

ServerConfig parse_command_line(int argc, char** argv) {
    ServerConfig config;
    std::string value;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            config.show_version = true;
            continue;
        }

        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            config.show_help = true;
            continue;
        }

        if (std::strcmp(argv[i], "--pdeathsig") == 0) {
            config.enable_pdeathsig = true;
            continue;
        }

        if (take_option("--log-config", argc, argv, i, value)) {
            config.log_config = value;
            continue;
        }

        if (take_option("--transport", argc, argv, i, value)) {
            if (value == "stdio") {
                config.transport = TransportKind::Stdio;
            } else if (value == "socket") {
                config.transport = TransportKind::Socket;
            } else {
                throw ConfigError("--transport must be 'stdio' or 'socket', got '" + value + "'");
            }
            continue;
        }

        if (take_option("--socket", argc, argv, i, value)) {
            if (value.empty()) {
                throw ConfigError("--socket path cannot be empty");
            }
            config.socket_path = value;
            config.transport = TransportKind::Socket;
            continue;
        }

        if (take_option("--workers", argc, argv, i, value)) {
            config.workers = parse_count("--workers", value);
            continue;
        }

        if (take_option("--tool-timeout", argc, argv, i, value)) {
            config.tool_timeout = std::chrono::seconds(parse_count("--tool-timeout", value));
            continue;
        }

        if (take_option("--max-items", argc, argv, i, value)) {
            config.max_items = parse_count("--max-items", value);
            if (config.max_items == 0) {
                throw ConfigError("--max-items must be at least 1");
            }
            continue;
        }

        if (take_option("--apktool", argc, argv, i, value)) {
            config.apktool_path = value;
            continue;
        }

        if (take_option("--jadx", argc, argv, i, value)) {
            config.jadx_path = value;
            continue;
        }

        if (take_option("--project", argc, argv, i, value)) {
            config.project_dir = value;
            continue;
        }

        throw ConfigError(std::string("unknown option: ") + argv[i]);
    }

    return config;
}

std::string usage_text() {
    std::ostringstream out;
    out << "Usage: toolbridge [options]\n"
        << "  -v, --version             print version information and exit\n"
        << "  -h, --help                print this help and exit\n"
        << "  --log-config PATH         log4cplus property file (default: log4cplus.ini)\n"
        << "  --transport stdio|socket  request channel (default: stdio)\n"
        << "  --socket PATH             Unix socket path, implies --transport socket\n"
        << "  --workers N               dispatch worker threads, 0 = inline (default: 0)\n"
        << "  --tool-timeout SECONDS    execution window per tool call, 0 = none (default: 300)\n"
        << "  --max-items N             truncate list results after N items (default: 1000)\n"
        << "  --apktool PATH            apktool executable (default: apktool)\n"
        << "  --jadx PATH               jadx executable (default: jadx)\n"
        << "  --project DIR             directory mounted as the project store\n"
        << "  --pdeathsig               exit when the parent process dies (Linux)\n";
    return out.str();
}

} // namespace toolbridge
