#pragma once

#include "common/config.hpp"
#include "common/error.hpp"
#include "common/token_source.hpp"
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace livegate {

namespace net = boost::asio;

/**
 * CredentialCache - process-wide bearer token for the upstream service
 *
 * Constructed once in main() and passed by reference to every connector.
 * The underlying TokenSource is created on first need and reused for every
 * refresh. Refresh is single-flight: concurrent callers serialize on one
 * mutex and the ones that waited observe the fresh token without I/O.
 */
class CredentialCache {
public:
    using SourceFactory = std::function<Result<std::unique_ptr<TokenSource>>()>;

    // Minimum remaining lifetime for a cached token to be handed out
    static constexpr std::chrono::seconds kRefreshMargin{60};

    // Assumed lifetime when the provider does not report an expiry
    static constexpr std::chrono::minutes kDefaultValidity{55};

    CredentialCache(CredentialMode mode, std::string static_token, SourceFactory factory);

    // Mode, static token and default token source taken from config
    explicit CredentialCache(const GatewayConfig& config);

    CredentialCache(const CredentialCache&) = delete;
    CredentialCache& operator=(const CredentialCache&) = delete;

    /**
     * Return a token valid for at least kRefreshMargin, refreshing if needed.
     * Blocks during a refresh.
     */
    Result<std::string> get_token();

    /**
     * get_token() run on the blocking pool, resumed on the caller's executor.
     */
    net::awaitable<Result<std::string>> async_get_token(net::thread_pool& blocking_pool);

    // Number of refreshes performed against the token source
    uint64_t refresh_count() const;

private:
    CredentialMode mode_;
    std::string static_token_;
    SourceFactory factory_;

    mutable std::mutex mutex_;
    std::unique_ptr<TokenSource> source_;
    std::optional<std::string> token_;
    std::chrono::system_clock::time_point expiry_{};
    uint64_t refresh_count_{0};
};

} // namespace livegate
