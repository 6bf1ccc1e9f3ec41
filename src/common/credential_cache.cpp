#include "common/credential_cache.hpp"
#include "common/log.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace livegate {

CredentialCache::CredentialCache(CredentialMode mode, std::string static_token, SourceFactory factory)
    : mode_(mode)
    , static_token_(std::move(static_token))
    , factory_(std::move(factory))
{}

CredentialCache::CredentialCache(const GatewayConfig& config)
    : CredentialCache(config.credential_mode(), config.auth.access_token,
                      [config]() { return make_default_token_source(config); })
{}

Result<std::string> CredentialCache::get_token() {
    if (mode_ == CredentialMode::STATIC_TOKEN) {
        return static_token_;
    }

    if (mode_ == CredentialMode::API_KEY) {
        return make_error(ErrorCode::CONFIGURATION_ERROR,
                          "API keys are not supported for the Live API WebSocket. Use OAuth2.");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    if (token_ && expiry_ - now > kRefreshMargin) {
        return *token_;
    }

    if (!source_) {
        auto source = factory_();
        if (!source) {
            return std::unexpected(source.error());
        }
        source_ = std::move(*source);
    }

    NLOG_DEBUG(log::AUTH_LOGGER, "Refreshing access token via {}", source_->name());
    ++refresh_count_;

    auto fetched = source_->fetch();
    if (!fetched) {
        NLOG_WARN(log::AUTH_LOGGER, "Token refresh failed: {}", fetched.error().message);
        return make_error(ErrorCode::AUTH_ERROR, fetched.error().message);
    }

    if (fetched->token.empty()) {
        return make_error(ErrorCode::AUTH_ERROR, "Failed to obtain access token");
    }

    token_ = std::move(fetched->token);
    expiry_ = fetched->expiry.value_or(std::chrono::system_clock::now() + kDefaultValidity);

    NLOG_INFO(log::AUTH_LOGGER, "Access token refreshed, valid for {}s",
              std::chrono::duration_cast<std::chrono::seconds>(expiry_ - now).count());
    return *token_;
}

net::awaitable<Result<std::string>> CredentialCache::async_get_token(net::thread_pool& blocking_pool) {
    if (mode_ != CredentialMode::OAUTH) {
        co_return get_token();
    }

    // Run the (possibly blocking) refresh off the io thread
    co_return co_await net::co_spawn(
        blocking_pool,
        [this]() -> net::awaitable<Result<std::string>> {
            co_return get_token();
        },
        net::use_awaitable);
}

uint64_t CredentialCache::refresh_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return refresh_count_;
}

} // namespace livegate
