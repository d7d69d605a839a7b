#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace toolbridge {

enum class TransportKind {
    Stdio,
    Socket,
};

struct ServerConfig {
    std::string server_name = "toolbridge";
    std::string server_version = VERSION_STRING;
    std::string protocol_version = "2024-11-05";

    std::string log_config = "log4cplus.ini";
    TransportKind transport = TransportKind::Stdio;
    std::string socket_path = "/tmp/toolbridge.sock";

    // 0 = dispatch inline on the reading thread
    size_t workers = 0;
    // 0 = no execution window
    std::chrono::milliseconds tool_timeout{std::chrono::seconds(300)};
    // upper bound on list-style results before they are truncated
    size_t max_items = 1000;

    std::string apktool_path = "apktool";
    std::string jadx_path = "jadx";
    std::string project_dir;

    bool enable_pdeathsig = false;
    bool show_version = false;
    bool show_help = false;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Parse command line options.
 * Both "--opt value" and "--opt=value" forms are accepted.
 * @throws ConfigError on unknown options or invalid values
 */
ServerConfig parse_command_line(int argc, char** argv);

std::string usage_text();

} // namespace toolbridge
