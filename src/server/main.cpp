#include "server/gateway_server.hpp"
#include "server/relay_session.hpp"
#include "server/upstream_connector.hpp"
#include "common/config.hpp"
#include "common/credential_cache.hpp"
#include "common/io_context_pool.hpp"
#include "common/log.hpp"

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <iostream>

using namespace livegate;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>   Optional JSON configuration file (environment overrides it)\n"
              << "  -h, --help            Show this help message\n"
              << std::endl;
}

const char* credential_mode_name(CredentialMode mode) {
    switch (mode) {
        case CredentialMode::STATIC_TOKEN: return "static token";
        case CredentialMode::API_KEY: return "API key (unsupported)";
        case CredentialMode::OAUTH: return "OAuth2";
    }
    return "unknown";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    log::init_from_env();

    auto config_result = config_path.empty() ? GatewayConfig::load_from_env()
                                             : GatewayConfig::load(config_path);
    if (!config_result) {
        std::cerr << "Error: " << config_error_message(config_result.error());
        if (!config_path.empty()) {
            std::cerr << " (" << config_path << ")";
        }
        std::cerr << "\n\n";
        print_usage(argv[0]);
        return 1;
    }
    GatewayConfig config = std::move(*config_result);

    // Reopen the loggers with the merged settings
    log::shutdown();
    log::LogConfig log_config;
    log_config.level = log::level_from_string(config.log_level);
    log_config.file_path = config.log_file;
    log::init(log_config);

    LOG_INFO("LiveGate voice gateway starting...");
    LOG_INFO("Upstream: {} (model {})", config.upstream.url, config.upstream.model);
    LOG_INFO("Credentials: {}", credential_mode_name(config.credential_mode()));
    if (config.credential_mode() == CredentialMode::API_KEY) {
        LOG_WARN("GEMINI_API_KEY is set but API keys cannot open the Live WebSocket; "
                 "sessions will be refused until OAuth2 credentials are configured");
    }

    try {
        IOContextPool pool(config.server.num_threads);

        // Token refreshes block on HTTP, keep them off the io threads
        net::thread_pool blocking_pool(2);

        CredentialCache credentials(config);

        UpstreamConnector connector(
            UpstreamConnector::Options{
                config.upstream.url,
                config.upstream.ping_interval,
                config.upstream.ping_timeout,
            },
            credentials, blocking_pool);

        RelaySession::Options session_options{
            upstream::SetupParams{config.upstream.model, config.upstream.system_instruction},
            config.relay.pre_ready_capacity,
        };

        GatewayServer server(
            pool, config.server.bind_address, config.server.port,
            [&connector, &session_options](std::shared_ptr<MessageChannel> client) -> net::awaitable<void> {
                auto executor = co_await net::this_coro::executor;
                auto session = std::make_shared<RelaySession>(
                    executor, std::move(client),
                    [&connector]() { return connector.connect(); },
                    session_options);
                co_await session->run();
            });

        boost::asio::signal_set signals(pool.at(0), SIGINT, SIGTERM);
        signals.async_wait([&](boost::system::error_code ec, int signal_number) {
            if (!ec) {
                LOG_INFO("Received signal {}, shutting down...", signal_number);
                server.stop();
                pool.stop();
            }
        });

        server.start();

        LOG_INFO("Gateway running with {} IO threads", pool.size());
        pool.run();

        blocking_pool.join();
        LOG_INFO("Gateway stopped");
        log::shutdown();
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        log::shutdown();
        return 1;
    }
}
