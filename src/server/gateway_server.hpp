#pragma once

#include "common/io_context_pool.hpp"
#include "common/message_channel.hpp"
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace livegate {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// Path that upgrades to a relay session
constexpr const char* RELAY_PATH = "/ws";

/**
 * Answer a plain HTTP request.
 * @return std::nullopt when the request is a WebSocket upgrade on RELAY_PATH
 */
std::optional<HttpResponse> route_http_request(const HttpRequest& req);

/**
 * GatewayServer - HTTP listener that turns /ws upgrades into relay sessions
 *
 * Accepts on pool thread 0 and hands each connection to the next pool
 * context. The connection, its WebSocket and the session it feeds stay on
 * that context until closed.
 */
class GatewayServer {
public:
    /**
     * Runs one accepted client to completion on the channel's executor.
     */
    using SessionRunner = std::function<net::awaitable<void>(std::shared_ptr<MessageChannel> client)>;

    GatewayServer(IOContextPool& pool, std::string address, uint16_t port, SessionRunner runner);

    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    // Bind and start accepting. Throws on bind failure.
    void start();

    void stop();

    bool running() const { return running_.load(std::memory_order_acquire); }

    // Port actually bound (useful when started with port 0)
    uint16_t local_port() const { return bound_port_; }

    struct Stats {
        uint64_t connections_accepted{0};
        uint64_t sessions_started{0};
        uint64_t active_sessions{0};
    };
    Stats get_stats() const;

private:
    net::awaitable<void> accept_loop();

    net::awaitable<void> handle_connection(tcp::socket socket);

    IOContextPool& pool_;
    std::string address_;
    uint16_t port_;
    uint16_t bound_port_{0};
    SessionRunner runner_;

    std::unique_ptr<tcp::acceptor> acceptor_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> connections_accepted_{0};
    std::atomic<uint64_t> sessions_started_{0};
    std::atomic<uint64_t> active_sessions_{0};
};

} // namespace livegate
