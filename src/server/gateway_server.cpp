#include "server/gateway_server.hpp"
#include "common/log.hpp"
#include "common/ws_channel.hpp"

namespace livegate {

namespace {

constexpr const char* SERVER_NAME = "LiveGate/1.0";
constexpr std::chrono::seconds REQUEST_TIMEOUT{30};

HttpResponse text_response(const HttpRequest& req, http::status status, std::string body) {
    HttpResponse res{status, req.version()};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(false);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

std::string_view request_path(const HttpRequest& req) {
    std::string_view target(req.target().data(), req.target().size());
    return target.substr(0, target.find('?'));
}

} // anonymous namespace

std::optional<HttpResponse> route_http_request(const HttpRequest& req) {
    auto path = request_path(req);

    if (req.method() == http::verb::options) {
        HttpResponse res{http::status::no_content, req.version()};
        res.set(http::field::server, SERVER_NAME);
        res.set(http::field::access_control_allow_origin, "*");
        res.set(http::field::access_control_allow_methods, "GET, OPTIONS");
        res.set(http::field::access_control_allow_headers, "*");
        res.keep_alive(false);
        res.prepare_payload();
        return res;
    }

    if (path == RELAY_PATH) {
        if (websocket::is_upgrade(req)) {
            return std::nullopt;
        }
        auto res = text_response(req, http::status::upgrade_required, "Expected WebSocket upgrade");
        res.set(http::field::upgrade, "websocket");
        return res;
    }

    if (req.method() == http::verb::get || req.method() == http::verb::head) {
        if (path == "/") {
            return text_response(req, http::status::ok, "Gemini Live Voice Gateway");
        }
        if (path == "/health") {
            return text_response(req, http::status::ok, "ok");
        }
    }

    return text_response(req, http::status::not_found, "Not Found");
}

// ============================================================================
// GatewayServer
// ============================================================================

GatewayServer::GatewayServer(IOContextPool& pool, std::string address, uint16_t port, SessionRunner runner)
    : pool_(pool)
    , address_(std::move(address))
    , port_(port)
    , runner_(std::move(runner))
{}

GatewayServer::~GatewayServer() {
    stop();
}

void GatewayServer::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    try {
        auto& ioc = pool_.at(0);
        auto endpoint = tcp::endpoint{net::ip::make_address(address_), port_};

        acceptor_ = std::make_unique<tcp::acceptor>(ioc);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(net::socket_base::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen(net::socket_base::max_listen_connections);
        bound_port_ = acceptor_->local_endpoint().port();

        net::co_spawn(
            ioc,
            [this]() -> net::awaitable<void> {
                co_await accept_loop();
            },
            [](std::exception_ptr ep) {
                if (ep) {
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        NLOG_ERROR(log::SERVER_LOGGER, "Accept loop exception: {}", e.what());
                    }
                }
            });

        NLOG_INFO(log::SERVER_LOGGER, "Listening on {}:{}", address_, bound_port_);

    } catch (const std::exception& e) {
        running_.store(false, std::memory_order_release);
        NLOG_ERROR(log::SERVER_LOGGER, "Failed to listen on {}:{}: {}", address_, port_, e.what());
        throw;
    }
}

void GatewayServer::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    // The acceptor lives on thread 0
    net::post(pool_.at(0), [this]() {
        if (acceptor_ && acceptor_->is_open()) {
            beast::error_code ec;
            acceptor_->close(ec);
        }
    });

    NLOG_INFO(log::SERVER_LOGGER, "Stopped accepting connections");
}

GatewayServer::Stats GatewayServer::get_stats() const {
    return {
        connections_accepted_.load(std::memory_order_relaxed),
        sessions_started_.load(std::memory_order_relaxed),
        active_sessions_.load(std::memory_order_relaxed)
    };
}

net::awaitable<void> GatewayServer::accept_loop() {
    while (running_.load(std::memory_order_acquire)) {
        try {
            auto& target_ioc = pool_.next();

            tcp::socket socket(target_ioc);
            co_await acceptor_->async_accept(socket, net::use_awaitable);

            connections_accepted_.fetch_add(1, std::memory_order_relaxed);

            beast::error_code ec;
            auto remote = socket.remote_endpoint(ec);
            NLOG_DEBUG(log::SERVER_LOGGER, "Accepted connection from {}",
                       ec ? std::string("unknown") : remote.address().to_string());

            // Continue on the connection's own thread
            net::co_spawn(
                target_ioc,
                [this, socket = std::move(socket)]() mutable -> net::awaitable<void> {
                    co_await handle_connection(std::move(socket));
                },
                [](std::exception_ptr ep) {
                    if (ep) {
                        try {
                            std::rethrow_exception(ep);
                        } catch (const std::exception& e) {
                            NLOG_ERROR(log::SERVER_LOGGER, "Connection handler exception: {}", e.what());
                        }
                    }
                });

        } catch (const boost::system::system_error& e) {
            if (e.code() == net::error::operation_aborted) {
                break;
            }
            NLOG_WARN(log::SERVER_LOGGER, "Accept error: {}", e.what());
        }
    }
}

net::awaitable<void> GatewayServer::handle_connection(tcp::socket socket) {
    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;
    HttpRequest req;

    try {
        stream.expires_after(REQUEST_TIMEOUT);
        co_await http::async_read(stream, buffer, req, net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        NLOG_DEBUG(log::SERVER_LOGGER, "Failed to read request: {}", e.code().message());
        co_return;
    }

    if (auto res = route_http_request(req)) {
        NLOG_DEBUG(log::SERVER_LOGGER, "{} {} -> {}", std::string(req.method_string()),
                   std::string(req.target()), res->result_int());
        beast::error_code ec;
        co_await http::async_write(stream, *res, net::redirect_error(net::use_awaitable, ec));
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        co_return;
    }

    // The WebSocket stream applies its own timeouts from here on
    stream.expires_never();
    auto ws = std::make_unique<WsChannel::WsStream>(std::move(stream));

    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = REQUEST_TIMEOUT;
    opt.idle_timeout = websocket::stream_base::none();
    opt.keep_alive_pings = false;
    ws->set_option(opt);
    ws->set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, SERVER_NAME);
    }));

    try {
        co_await ws->async_accept(req, net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        NLOG_WARN(log::SERVER_LOGGER, "WebSocket upgrade failed: {}", e.code().message());
        co_return;
    }

    beast::error_code ec;
    auto remote = beast::get_lowest_layer(*ws).socket().remote_endpoint(ec);
    auto name = "client " + (ec ? std::string("unknown") : remote.address().to_string() + ":" +
                             std::to_string(remote.port()));

    auto channel = std::make_shared<WsChannel>(std::move(ws), std::move(name));
    channel->start();

    sessions_started_.fetch_add(1, std::memory_order_relaxed);
    active_sessions_.fetch_add(1, std::memory_order_relaxed);

    bool failed = false;
    try {
        co_await runner_(channel);
    } catch (const std::exception& e) {
        NLOG_ERROR(log::SERVER_LOGGER, "Session for {} failed: {}", channel->description(), e.what());
        failed = true;
    }
    if (failed) {
        co_await channel->close();
    }

    active_sessions_.fetch_sub(1, std::memory_order_relaxed);
}

} // namespace livegate
