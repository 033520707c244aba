#include "core/BridgeConfig.hpp"
#include "http/CurlHttpClient.hpp"
#include "http/RemoteInvoker.hpp"
#include "mcp/BridgeSession.hpp"
#include "mcp/StdioTransport.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>

namespace {
    void signal_handler(int /*signal*/) {
        // In-flight upstream calls are abandoned
        std::_Exit(0);
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    // stdout carries the protocol, so every diagnostic goes to stderr
    void setup_logging() {
        auto logger = spdlog::stderr_logger_mt("dify-bridge");
        logger->set_pattern("[dify-bridge] [%l] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
    }
}

int main(int argc, char** argv) {
    setup_logging();

    // Parse command-line arguments
    CLI::App app{"Dify MCP Bridge - stdio JSON-RPC to remote MCP over HTTP"};

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info");

    std::string env_file = ".env";
    app.add_option("--env-file", env_file, "Dotenv file read at startup (existing variables win)")
        ->default_val(".env");

    std::string url;
    app.add_option("--url", url, "Remote MCP URL (overrides DIFY_MCP_URL)");

    std::string token;
    app.add_option("--token", token, "Bearer token (overrides DIFY_MCP_TOKEN)");

    std::string timeout;
    app.add_option("--timeout", timeout, "Request timeout in milliseconds (overrides DIFY_MCP_TIMEOUT)");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // CLI11 prints help to stdout; keep the protocol stream clean
        return app.exit(e, std::cerr, std::cerr);
    }

    if (version) {
        std::cerr << "dify-mcp-bridge version " << dify_bridge::BridgeSession::kServerVersion << std::endl;
        return 0;
    }

    // Configure logging
    auto level = spdlog::level::from_str(log_level);
    if (level == spdlog::level::off && log_level != "off") {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }
    spdlog::set_level(level);

    try {
        dify_bridge::load_env_file(env_file);

        auto config = dify_bridge::BridgeConfig::from_environment();
        if (!url.empty()) {
            config.remote_url = url;
        }
        if (!token.empty()) {
            config.token = token;
        }
        if (!timeout.empty()) {
            config.timeout_ms = dify_bridge::BridgeConfig::parse_timeout(timeout);
        }
        config.validate();

        setup_signal_handlers();

        auto client = std::make_shared<dify_bridge::CurlHttpClient>();
        auto invoker = std::make_unique<dify_bridge::RemoteInvoker>(
            client,
            dify_bridge::RemoteEndpoint{config.remote_url, config.token, config.timeout_ms});
        auto transport = std::make_unique<dify_bridge::StdioTransport>();
        dify_bridge::BridgeSession session(std::move(transport), std::move(invoker));

        spdlog::info("Starting bridge → {}", config.remote_url);

        // Run session (blocks until end of input)
        session.run();

        spdlog::info("Bridge stopped cleanly");
        return 0;

    } catch (const dify_bridge::ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
