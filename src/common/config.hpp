#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace livegate {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
};

std::string config_error_message(ConfigError error);

// ============================================================================
// Defaults
// ============================================================================

namespace defaults {

constexpr const char* UPSTREAM_URL =
    "wss://generativelanguage.googleapis.com/ws/"
    "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";
constexpr const char* MODEL = "models/gemini-2.5-flash-native-audio-preview-12-2025";
constexpr const char* OAUTH_SCOPE = "https://www.googleapis.com/auth/generative-language";
constexpr const char* TOKEN_URI = "https://oauth2.googleapis.com/token";
extern const char* const SYSTEM_INSTRUCTION;

} // namespace defaults

// How the gateway authenticates to the upstream service
enum class CredentialMode {
    STATIC_TOKEN,   // Fixed bearer token, never refreshed
    API_KEY,        // Not usable with the streaming transport
    OAUTH,          // Refreshed OAuth2 access token
};

// Environment lookup, injectable for tests
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

EnvLookup process_env();

// ============================================================================
// Gateway Configuration
// ============================================================================

struct GatewayConfig {
    struct Server {
        std::string bind_address = "0.0.0.0";
        uint16_t port = 8080;
        size_t num_threads = 0;  // 0 = auto (hardware_concurrency)
    } server;

    struct Upstream {
        std::string url = defaults::UPSTREAM_URL;
        std::string model = defaults::MODEL;
        std::string system_instruction = defaults::SYSTEM_INSTRUCTION;
        std::chrono::seconds ping_interval{20};
        std::chrono::seconds ping_timeout{20};
    } upstream;

    struct Auth {
        std::string oauth_scope = defaults::OAUTH_SCOPE;
        std::string access_token;       // Static-token override
        bool api_key_present = false;   // Key value itself is never kept
        std::string credentials_file;   // Service account JSON
        std::string client_email;
        std::string private_key;        // PEM
        std::string token_uri = defaults::TOKEN_URI;
    } auth;

    struct Relay {
        size_t pre_ready_capacity = 8;
    } relay;

    // Logging
    std::string log_level = "info";
    std::string log_file;

    CredentialMode credential_mode() const;

    // Load from JSON file, then overlay the process environment
    static std::expected<GatewayConfig, ConfigError> load(const std::string& path);

    // Load from JSON string (for testing)
    static std::expected<GatewayConfig, ConfigError> parse(const std::string& json_content);

    // Defaults overlaid with the process environment
    static std::expected<GatewayConfig, ConfigError> load_from_env();

    // Overlay environment values onto this config
    std::expected<void, ConfigError> apply_env(const EnvLookup& env);
};

} // namespace livegate
