/// markitdown-mcp: serves convert_to_markdown over MCP.
/// Usage: markitdown-mcp [--sse] [--host HOST] [--port PORT] [--log-level LEVEL]
///                       [--converter CMD] [--converter-timeout SECONDS]

#include <mdmcp/mdmcp.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <thread>

namespace {

constexpr int EXIT_USAGE = 2;

std::shared_ptr<mdmcp::CapabilityRegistry> build_registry(const mdmcp::CliOptions& cli) {
    mdmcp::CommandConverter::Options copts;
    copts.command = cli.converter_command.front();
    copts.args.assign(cli.converter_command.begin() + 1, cli.converter_command.end());
    copts.timeout = cli.converter_timeout;

    auto registry = std::make_shared<mdmcp::CapabilityRegistry>();
    registry->register_capability(
        mdmcp::make_convert_capability(std::make_shared<mdmcp::CommandConverter>(std::move(copts))));
    return registry;
}

mdmcp::Implementation server_info() {
    return {"markitdown", std::nullopt, std::string(mdmcp::LIBRARY_VERSION)};
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    mdmcp::CliOptions cli;
    try {
        cli = mdmcp::parse_cli(argc, argv);
    } catch (const mdmcp::UsageError& e) {
        std::cerr << argv[0] << ": " << e.what() << "\n\n" << mdmcp::usage_text(argv[0]);
        return EXIT_USAGE;
    }
    if (cli.help) {
        std::cout << mdmcp::usage_text(argv[0]);
        return 0;
    }
    if (cli.version) {
        std::cout << "markitdown-mcp " << mdmcp::LIBRARY_VERSION << "\n";
        return 0;
    }

    mdmcp::init_logging(mdmcp::parse_log_level(cli.log_level));

    // Shutdown signals are taken by a dedicated thread; every thread started
    // from here on inherits the blocked mask.
    std::signal(SIGPIPE, SIG_IGN);
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);

    auto registry = build_registry(cli);

    std::unique_ptr<mdmcp::ITransport> transport;
    try {
        if (cli.mode == mdmcp::TransportMode::Sse) {
            mdmcp::SseTransport::Options opts;
            opts.host = cli.host;
            opts.port = cli.port;
            opts.server_info = server_info();
            auto sse = std::make_unique<mdmcp::SseTransport>(registry, std::move(opts));
            sse->bind();
            transport = std::move(sse);
        } else {
            mdmcp::StdioTransport::Options opts;
            opts.server_info = server_info();
            transport = std::make_unique<mdmcp::StdioTransport>(registry, std::move(opts));
        }
    } catch (const mdmcp::McpTransportError& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    std::atomic<bool> finished{false};
    std::thread signal_thread([&]() {
        int sig = 0;
        sigwait(&shutdown_signals, &sig);
        if (finished) return;
        spdlog::info("Received signal {}, shutting down", sig);
        transport->shutdown();
    });

    int status = 0;
    try {
        transport->serve();
    } catch (const mdmcp::McpTransportError& e) {
        spdlog::critical("{}", e.what());
        status = 1;
    } catch (const std::exception& e) {
        spdlog::critical("Transport failed: {}", e.what());
        status = 1;
    }

    finished = true;
    pthread_kill(signal_thread.native_handle(), SIGTERM);
    signal_thread.join();
    return status;
}
