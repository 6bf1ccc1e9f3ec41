#pragma once

#include "common/config.hpp"
#include "common/error.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace livegate {

// A bearer token and, when the provider reports it, its absolute expiry (UTC)
struct AccessToken {
    std::string token;
    std::optional<std::chrono::system_clock::time_point> expiry;
};

/**
 * TokenSource - an identity provider that can mint access tokens
 *
 * fetch() blocks on network I/O; callers run it off the io threads.
 */
class TokenSource {
public:
    virtual ~TokenSource() = default;

    virtual Result<AccessToken> fetch() = 0;

    virtual std::string name() const = 0;
};

// Parse an OAuth2 token endpoint response ({"access_token", "expires_in"})
Result<AccessToken> parse_token_response(std::string_view body,
                                         std::chrono::system_clock::time_point now);

// ============================================================================
// Service account (JWT bearer grant)
// ============================================================================

class ServiceAccountTokenSource : public TokenSource {
public:
    struct Key {
        std::string client_email;
        std::string private_key;  // PEM, PKCS#8
        std::string token_uri;
    };

    // Read a service account JSON key file
    static Result<Key> load_key_file(const std::string& path);

    ServiceAccountTokenSource(Key key, std::string scope);

    Result<AccessToken> fetch() override;
    std::string name() const override { return "service-account:" + key_.client_email; }

    // Signed RS256 assertion for the token endpoint
    Result<std::string> make_assertion(std::chrono::system_clock::time_point now) const;

private:
    Key key_;
    std::string scope_;
};

// ============================================================================
// User credentials (refresh token grant, as written by gcloud)
// ============================================================================

class AuthorizedUserTokenSource : public TokenSource {
public:
    struct Credentials {
        std::string client_id;
        std::string client_secret;
        std::string refresh_token;
        std::string token_uri;
    };

    // Read an "authorized_user" JSON credentials file
    static Result<Credentials> load_file(const std::string& path);

    explicit AuthorizedUserTokenSource(Credentials credentials);

    Result<AccessToken> fetch() override;
    std::string name() const override { return "authorized-user:" + credentials_.client_id; }

    // Form body posted to the token endpoint
    std::string refresh_request_body() const;

private:
    Credentials credentials_;
};

// ============================================================================
// Compute metadata server (Cloud Run / GCE)
// ============================================================================

class MetadataServerTokenSource : public TokenSource {
public:
    explicit MetadataServerTokenSource(std::string scope,
                                       std::string host = "metadata.google.internal");

    Result<AccessToken> fetch() override;
    std::string name() const override { return "metadata-server"; }

private:
    std::string scope_;
    std::string host_;
};

/**
 * Pick a token source the way Application Default Credentials does:
 * credentials file (service account or authorized user), then key
 * material from config, then the metadata server.
 */
Result<std::unique_ptr<TokenSource>> make_default_token_source(const GatewayConfig& config);

} // namespace livegate
