#include "dispatcher.hpp"
#include "ipc_server.hpp"
#include "line_transport.hpp"
#include "logger.hpp"
#include "process_runner.hpp"
#include "project_store.hpp"
#include "server_config.hpp"
#include "socket_transport.hpp"
#include "tool/tool_registry.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

using namespace toolbridge;

namespace {

int serve_socket(const ServerConfig& config, Dispatcher& dispatcher) {
    // Termination signals are taken synchronously below; block them before any thread starts.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    IpcServer server(config.socket_path,
                     make_frame_handler([&dispatcher](const Request& request) { return dispatcher.dispatch(request); }),
                     config.workers > 0 ? config.workers : 4);

    if (!server.start()) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to start IPC server");
        return 1;
    }

    int signal_number = 0;
    sigwait(&signals, &signal_number);
    LOG4CPLUS_INFO(core_logger(), "Received signal " << signal_number << ", shutting down");
    server.stop();
    return 0;
}

int serve_stdio(const ServerConfig& config, Dispatcher& dispatcher) {
    std::ios::sync_with_stdio(false);
    LineTransport transport(std::cin, std::cout,
                            [&dispatcher](const Request& request) { return dispatcher.dispatch(request); },
                            config.workers);
    transport.run();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    ServerConfig config;
    try {
        config = parse_command_line(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "toolbridge: " << e.what() << "\n\n" << usage_text();
        return 2;
    }

    if (config.show_help) {
        std::cout << usage_text();
        return 0;
    }

    if (config.show_version) {
        std::cout << "Version: " << VERSION_STRING << std::endl;
        std::cout << "Commit: " << GIT_VERSION_STRING << std::endl;
        std::cout << "Build Time: " << BUILD_TIMESTAMP << std::endl;
        return 0;
    }

#ifdef __linux__
    if (config.enable_pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    init_logging(config.log_config);

    // A client closing its end must surface as a write error, not kill the process.
    signal(SIGPIPE, SIG_IGN);

    LOG4CPLUS_INFO(core_logger(), "toolbridge starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << VERSION_STRING << ", Commit: " << GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Transport: "
                   << (config.transport == TransportKind::Socket ? "socket " + config.socket_path : std::string("stdio")));
    LOG4CPLUS_INFO(core_logger(), "Tool timeout: " << config.tool_timeout.count() << " ms, workers: " << config.workers);
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (config.enable_pdeathsig ? "enabled" : "disabled"));

    std::unique_ptr<project::ProjectStore> store;
    if (config.project_dir.empty()) {
        store = std::make_unique<project::ProjectStore>("project");
    } else {
        try {
            store = project::load_project_directory(config.project_dir);
        } catch (const std::filesystem::filesystem_error& e) {
            LOG4CPLUS_ERROR(core_logger(), "Cannot load project: " << e.what());
            return 1;
        }
    }
    project::ProjectSession session(std::move(store));

    PosixProcessRunner runner;
    tools::ToolContext context{config, runner, session};

    tools::ToolRegistry registry;
    tools::register_builtin_tools(registry);
    LOG4CPLUS_INFO(core_logger(), "Registered " << registry.size() << " tool(s)");

    Dispatcher dispatcher(registry, context);

    int rc = config.transport == TransportKind::Socket ? serve_socket(config, dispatcher)
                                                       : serve_stdio(config, dispatcher);
    LOG4CPLUS_INFO(core_logger(), "toolbridge exiting with status " << rc);
    return rc;
}
