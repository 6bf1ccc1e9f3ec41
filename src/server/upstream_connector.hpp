#pragma once

#include "common/credential_cache.hpp"
#include "common/error.hpp"
#include "common/http_client.hpp"
#include "common/message_channel.hpp"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace livegate {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

/**
 * UpstreamConnector - opens authenticated Live API WebSocket connections
 *
 * One connect() per relay session. Failures are returned, never retried.
 */
class UpstreamConnector {
public:
    struct Options {
        std::string url;
        std::chrono::seconds ping_interval{20};
        std::chrono::seconds ping_timeout{20};
        std::chrono::seconds connect_timeout{30};
    };

    UpstreamConnector(Options options, CredentialCache& credentials, net::thread_pool& blocking_pool);

    UpstreamConnector(const UpstreamConnector&) = delete;
    UpstreamConnector& operator=(const UpstreamConnector&) = delete;

    /**
     * Get a token, connect and complete the WebSocket handshake on the
     * calling coroutine's executor. The returned channel is started.
     */
    net::awaitable<Result<std::shared_ptr<MessageChannel>>> connect();

    const Options& options() const { return options_; }

private:
    Options options_;
    std::optional<UrlComponents> url_parts_;
    CredentialCache& credentials_;
    net::thread_pool& blocking_pool_;
    std::shared_ptr<ssl::context> ssl_ctx_;
};

} // namespace livegate
