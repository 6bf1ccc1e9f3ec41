#include "server/upstream_connector.hpp"
#include "common/log.hpp"
#include "common/ws_channel.hpp"
#include <boost/beast/http.hpp>
#include <openssl/err.h>

namespace livegate {

namespace http = beast::http;

namespace {

// Beast sends a keepalive ping once half the idle timeout has passed without
// traffic and fails the stream when the whole idle timeout passes.
websocket::stream_base::timeout keepalive_timeout(const UpstreamConnector::Options& options) {
    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = options.connect_timeout;
    opt.idle_timeout = options.ping_interval + options.ping_timeout;
    opt.keep_alive_pings = true;
    return opt;
}

template<typename Stream>
void configure_stream(Stream& ws, const UpstreamConnector::Options& options, const std::string& token) {
    ws.set_option(keepalive_timeout(options));
    ws.set_option(websocket::stream_base::decorator([token](websocket::request_type& req) {
        req.set(http::field::user_agent, "LiveGate/1.0");
        req.set(http::field::authorization, "Bearer " + token);
    }));
    ws.read_message_max(0);  // No message size limit
    ws.auto_fragment(false);
}

std::string handshake_host(const UrlComponents& url) {
    if ((url.use_ssl && url.port == "443") || (!url.use_ssl && url.port == "80")) {
        return url.host;
    }
    return url.host + ":" + url.port;
}

} // anonymous namespace

UpstreamConnector::UpstreamConnector(Options options, CredentialCache& credentials,
                                     net::thread_pool& blocking_pool)
    : options_(std::move(options))
    , url_parts_(parse_url(options_.url))
    , credentials_(credentials)
    , blocking_pool_(blocking_pool)
    , ssl_ctx_(std::make_shared<ssl::context>(ssl::context::tlsv12_client))
{
    if (!url_parts_) {
        NLOG_ERROR(log::UPSTREAM_LOGGER, "Invalid upstream URL: {}", options_.url);
    }

    ssl_ctx_->set_default_verify_paths();
    ssl_ctx_->set_verify_mode(ssl::verify_peer);
}

net::awaitable<Result<std::shared_ptr<MessageChannel>>> UpstreamConnector::connect() {
    if (!url_parts_) {
        co_return make_error(ErrorCode::CONNECT_ERROR, "Invalid upstream URL: " + options_.url);
    }
    const auto& url = *url_parts_;

    auto token = co_await credentials_.async_get_token(blocking_pool_);
    if (!token) {
        co_return std::unexpected(token.error());
    }

    auto executor = co_await net::this_coro::executor;
    websocket::response_type response;

    try {
        tcp::resolver resolver(executor);
        auto endpoints = co_await resolver.async_resolve(url.host, url.port, net::use_awaitable);

        NLOG_INFO(log::UPSTREAM_LOGGER, "Connecting to {}:{}{}", url.host, url.port,
                  url.target.substr(0, url.target.find('?')));

        if (url.use_ssl) {
            auto wss = std::make_unique<WsChannel::WssStream>(executor, *ssl_ctx_);
            auto& tcp_layer = beast::get_lowest_layer(*wss);

            // Set SNI hostname
            if (!SSL_set_tlsext_host_name(wss->next_layer().native_handle(), url.host.c_str())) {
                throw boost::system::system_error(
                    boost::system::error_code(
                        static_cast<int>(::ERR_get_error()),
                        net::error::get_ssl_category()));
            }
            wss->next_layer().set_verify_callback(ssl::host_name_verification(url.host));

            tcp_layer.expires_after(options_.connect_timeout);
            co_await tcp_layer.async_connect(endpoints, net::use_awaitable);
            co_await wss->next_layer().async_handshake(ssl::stream_base::client, net::use_awaitable);

            // The websocket stream has its own timeouts from here on
            tcp_layer.expires_never();
            configure_stream(*wss, options_, *token);
            co_await wss->async_handshake(response, handshake_host(url), url.target, net::use_awaitable);

            auto channel = std::make_shared<WsChannel>(std::move(wss), ssl_ctx_, "upstream");
            channel->start();
            NLOG_INFO(log::UPSTREAM_LOGGER, "Connected to upstream");
            co_return std::shared_ptr<MessageChannel>(channel);
        }

        auto ws = std::make_unique<WsChannel::WsStream>(executor);
        auto& tcp_layer = beast::get_lowest_layer(*ws);

        tcp_layer.expires_after(options_.connect_timeout);
        co_await tcp_layer.async_connect(endpoints, net::use_awaitable);

        tcp_layer.expires_never();
        configure_stream(*ws, options_, *token);
        co_await ws->async_handshake(response, handshake_host(url), url.target, net::use_awaitable);

        auto channel = std::make_shared<WsChannel>(std::move(ws), "upstream");
        channel->start();
        NLOG_INFO(log::UPSTREAM_LOGGER, "Connected to upstream");
        co_return std::shared_ptr<MessageChannel>(channel);

    } catch (const boost::system::system_error& e) {
        std::string reason = e.code().message();
        if (e.code() == websocket::error::upgrade_declined) {
            reason = "handshake rejected with HTTP " + std::to_string(response.result_int());
        }
        NLOG_WARN(log::UPSTREAM_LOGGER, "Upstream connect failed: {}", reason);
        co_return make_error(ErrorCode::CONNECT_ERROR, "Upstream connection failed: " + reason);
    }
}

} // namespace livegate
