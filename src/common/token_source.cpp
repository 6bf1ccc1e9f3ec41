#include "common/token_source.hpp"
#include "common/http_client.hpp"
#include "common/log.hpp"
#include <boost/json.hpp>
#include <jwt-cpp/jwt.h>
#include <fstream>
#include <sstream>

namespace json = boost::json;

namespace livegate {

namespace {

constexpr const char* JWT_BEARER_GRANT = "urn:ietf:params:oauth:grant-type:jwt-bearer";
constexpr std::chrono::seconds ASSERTION_LIFETIME{3600};

std::string jstr(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return {};
}

Result<json::object> read_credentials_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error(ErrorCode::AUTH_ERROR, "Cannot open credentials file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json::error_code ec;
    auto jv = json::parse(buffer.str(), ec);
    if (ec || !jv.is_object()) {
        return make_error(ErrorCode::AUTH_ERROR, "Malformed credentials file: " + path);
    }
    return jv.as_object();
}

Error unsupported_type(const json::object& obj, const std::string& path) {
    return Error{ErrorCode::AUTH_ERROR,
                 "Unsupported credentials type '" + jstr(obj, "type") + "' in " + path};
}

std::string token_uri_or_default(const json::object& obj) {
    auto uri = jstr(obj, "token_uri");
    return uri.empty() ? std::string(defaults::TOKEN_URI) : uri;
}

Result<ServiceAccountTokenSource::Key> service_account_key(const json::object& obj, const std::string& path) {
    if (jstr(obj, "type") != "service_account") {
        return std::unexpected(unsupported_type(obj, path));
    }

    ServiceAccountTokenSource::Key key;
    key.client_email = jstr(obj, "client_email");
    key.private_key = jstr(obj, "private_key");
    key.token_uri = token_uri_or_default(obj);

    if (key.client_email.empty() || key.private_key.empty()) {
        return make_error(ErrorCode::AUTH_ERROR, "Credentials file lacks client_email/private_key");
    }
    return key;
}

Result<AuthorizedUserTokenSource::Credentials> authorized_user_credentials(const json::object& obj,
                                                                          const std::string& path) {
    if (jstr(obj, "type") != "authorized_user") {
        return std::unexpected(unsupported_type(obj, path));
    }

    AuthorizedUserTokenSource::Credentials creds;
    creds.client_id = jstr(obj, "client_id");
    creds.client_secret = jstr(obj, "client_secret");
    creds.refresh_token = jstr(obj, "refresh_token");
    creds.token_uri = token_uri_or_default(obj);

    if (creds.client_id.empty() || creds.refresh_token.empty()) {
        return make_error(ErrorCode::AUTH_ERROR, "Credentials file lacks client_id/refresh_token");
    }
    return creds;
}

// Token endpoint exchange shared by the grant-based sources
Result<AccessToken> exchange_at_token_endpoint(const std::string& token_uri, std::string body,
                                               std::chrono::system_clock::time_point now) {
    HttpRequestSpec req;
    req.method = "POST";
    req.url = token_uri;
    req.content_type = "application/x-www-form-urlencoded";
    req.body = std::move(body);

    auto res = http_request(req);
    if (!res) {
        return make_error(ErrorCode::AUTH_ERROR, "Token exchange failed: " + res.error().message);
    }
    if (res->status != 200) {
        NLOG_WARN(log::AUTH_LOGGER, "Token endpoint {} returned {}: {}",
                  token_uri, res->status, res->body);
        return make_error(ErrorCode::AUTH_ERROR,
                          "Token exchange failed with HTTP " + std::to_string(res->status));
    }

    return parse_token_response(res->body, now);
}

} // anonymous namespace

Result<AccessToken> parse_token_response(std::string_view body,
                                         std::chrono::system_clock::time_point now) {
    json::error_code ec;
    auto jv = json::parse(body, ec);
    if (ec || !jv.is_object()) {
        return make_error(ErrorCode::AUTH_ERROR, "Token endpoint returned non-JSON body");
    }
    const auto& obj = jv.as_object();

    AccessToken result;
    result.token = jstr(obj, "access_token");
    if (result.token.empty()) {
        auto reason = jstr(obj, "error_description");
        if (reason.empty()) reason = jstr(obj, "error");
        return make_error(ErrorCode::AUTH_ERROR,
                          "Token endpoint returned no access_token" +
                          (reason.empty() ? std::string{} : ": " + reason));
    }

    if (auto it = obj.find("expires_in"); it != obj.end()) {
        int64_t seconds = 0;
        if (it->value().is_int64()) seconds = it->value().as_int64();
        else if (it->value().is_uint64()) seconds = static_cast<int64_t>(it->value().as_uint64());
        else if (it->value().is_double()) seconds = static_cast<int64_t>(it->value().as_double());
        if (seconds > 0) {
            result.expiry = now + std::chrono::seconds(seconds);
        }
    }

    return result;
}

// ============================================================================
// ServiceAccountTokenSource
// ============================================================================

Result<ServiceAccountTokenSource::Key> ServiceAccountTokenSource::load_key_file(const std::string& path) {
    auto obj = read_credentials_file(path);
    if (!obj) {
        return std::unexpected(obj.error());
    }
    return service_account_key(*obj, path);
}

ServiceAccountTokenSource::ServiceAccountTokenSource(Key key, std::string scope)
    : key_(std::move(key))
    , scope_(std::move(scope))
{}

Result<std::string> ServiceAccountTokenSource::make_assertion(std::chrono::system_clock::time_point now) const {
    try {
        return jwt::create()
            .set_type("JWT")
            .set_issuer(key_.client_email)
            .set_audience(key_.token_uri)
            .set_issued_at(now)
            .set_expires_at(now + ASSERTION_LIFETIME)
            .set_payload_claim("scope", jwt::claim(scope_))
            .sign(jwt::algorithm::rs256{"", key_.private_key, "", ""});
    } catch (const std::exception& e) {
        return make_error(ErrorCode::AUTH_ERROR, std::string("Failed to sign assertion: ") + e.what());
    }
}

Result<AccessToken> ServiceAccountTokenSource::fetch() {
    auto now = std::chrono::system_clock::now();

    auto assertion = make_assertion(now);
    if (!assertion) {
        return std::unexpected(assertion.error());
    }

    return exchange_at_token_endpoint(
        key_.token_uri,
        "grant_type=" + form_urlencode(JWT_BEARER_GRANT) + "&assertion=" + form_urlencode(*assertion),
        now);
}

// ============================================================================
// AuthorizedUserTokenSource
// ============================================================================

Result<AuthorizedUserTokenSource::Credentials> AuthorizedUserTokenSource::load_file(const std::string& path) {
    auto obj = read_credentials_file(path);
    if (!obj) {
        return std::unexpected(obj.error());
    }
    return authorized_user_credentials(*obj, path);
}

AuthorizedUserTokenSource::AuthorizedUserTokenSource(Credentials credentials)
    : credentials_(std::move(credentials))
{}

std::string AuthorizedUserTokenSource::refresh_request_body() const {
    return "grant_type=refresh_token"
           "&client_id=" + form_urlencode(credentials_.client_id) +
           "&client_secret=" + form_urlencode(credentials_.client_secret) +
           "&refresh_token=" + form_urlencode(credentials_.refresh_token);
}

Result<AccessToken> AuthorizedUserTokenSource::fetch() {
    return exchange_at_token_endpoint(credentials_.token_uri, refresh_request_body(),
                                      std::chrono::system_clock::now());
}

// ============================================================================
// MetadataServerTokenSource
// ============================================================================

MetadataServerTokenSource::MetadataServerTokenSource(std::string scope, std::string host)
    : scope_(std::move(scope))
    , host_(std::move(host))
{}

Result<AccessToken> MetadataServerTokenSource::fetch() {
    auto now = std::chrono::system_clock::now();

    HttpRequestSpec req;
    req.url = "http://" + host_ +
              "/computeMetadata/v1/instance/service-accounts/default/token?scopes=" +
              form_urlencode(scope_);
    req.headers.emplace_back("Metadata-Flavor", "Google");

    auto res = http_request(req);
    if (!res) {
        return make_error(ErrorCode::AUTH_ERROR, "Metadata server unreachable: " + res.error().message);
    }
    if (res->status != 200) {
        return make_error(ErrorCode::AUTH_ERROR,
                          "Metadata server returned HTTP " + std::to_string(res->status));
    }

    return parse_token_response(res->body, now);
}

// ============================================================================
// Factory
// ============================================================================

Result<std::unique_ptr<TokenSource>> make_default_token_source(const GatewayConfig& config) {
    const auto& auth = config.auth;

    if (!auth.credentials_file.empty()) {
        auto obj = read_credentials_file(auth.credentials_file);
        if (!obj) {
            return std::unexpected(obj.error());
        }

        if (jstr(*obj, "type") == "authorized_user") {
            auto creds = authorized_user_credentials(*obj, auth.credentials_file);
            if (!creds) {
                return std::unexpected(creds.error());
            }
            NLOG_INFO(log::AUTH_LOGGER, "Using user credentials for client {} from {}",
                      creds->client_id, auth.credentials_file);
            return std::make_unique<AuthorizedUserTokenSource>(std::move(*creds));
        }

        auto key = service_account_key(*obj, auth.credentials_file);
        if (!key) {
            return std::unexpected(key.error());
        }
        NLOG_INFO(log::AUTH_LOGGER, "Using service account {} from {}",
                  key->client_email, auth.credentials_file);
        return std::make_unique<ServiceAccountTokenSource>(std::move(*key), auth.oauth_scope);
    }

    if (!auth.client_email.empty() && !auth.private_key.empty()) {
        NLOG_INFO(log::AUTH_LOGGER, "Using service account {} from environment", auth.client_email);
        return std::make_unique<ServiceAccountTokenSource>(
            ServiceAccountTokenSource::Key{auth.client_email, auth.private_key, auth.token_uri},
            auth.oauth_scope);
    }

    NLOG_INFO(log::AUTH_LOGGER, "Using compute metadata server credentials");
    return std::make_unique<MetadataServerTokenSource>(auth.oauth_scope);
}

} // namespace livegate
