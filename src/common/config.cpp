#include "common/config.hpp"
#include "common/log.hpp"
#include <boost/json.hpp>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace json = boost::json;

// Safe JSON field accessors with defaults
namespace {

std::string jstr(const json::object& obj, std::string_view key, const std::string& def = {}) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return def;
}

uint64_t juint(const json::object& obj, std::string_view key, uint64_t def = 0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_uint64()) return it->value().as_uint64();
        if (it->value().is_int64() && it->value().as_int64() >= 0)
            return static_cast<uint64_t>(it->value().as_int64());
    }
    return def;
}

const json::object* jsection(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_object())
        return &it->value().as_object();
    return nullptr;
}

template<typename T>
bool parse_number(const std::string& text, T& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

// Keys pasted into env vars usually carry literal "\n" sequences
std::string expand_newlines(const std::string& pem) {
    std::string out;
    out.reserve(pem.size());
    for (size_t i = 0; i < pem.size(); ++i) {
        if (pem[i] == '\\' && i + 1 < pem.size() && pem[i + 1] == 'n') {
            out.push_back('\n');
            ++i;
        } else {
            out.push_back(pem[i]);
        }
    }
    return out;
}

}  // anonymous namespace

namespace livegate {

namespace defaults {

const char* const SYSTEM_INSTRUCTION =
    "A warm, rounded, and friendly male cartoon voice. The character sounds like a chubby, honest piggy. "
    "The tone is soft, slightly deep but very cute, not scary. The speaking pace is relaxed and slightly slow, "
    "giving a feeling of being thoughtful and trustworthy. It has a tiny bit of nasal resonance (to hint at "
    "being a pig) but remains very clear and pleasant to listen to. Think of a mix between Winnie the Pooh and "
    "Baymax. It sounds optimistic, patient, and soothing for children. Please respond to the child.";

} // namespace defaults

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        default: return "Unknown configuration error";
    }
}

EnvLookup process_env() {
    return [](std::string_view name) -> std::optional<std::string> {
        if (const char* value = std::getenv(std::string(name).c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

CredentialMode GatewayConfig::credential_mode() const {
    if (!auth.access_token.empty()) {
        return CredentialMode::STATIC_TOKEN;
    }
    if (auth.api_key_present) {
        return CredentialMode::API_KEY;
    }
    return CredentialMode::OAUTH;
}

std::expected<GatewayConfig, ConfigError> GatewayConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse(buffer.str());
    if (!config) {
        return config;
    }
    if (auto applied = config->apply_env(process_env()); !applied) {
        return std::unexpected(applied.error());
    }
    return config;
}

std::expected<GatewayConfig, ConfigError> GatewayConfig::parse(const std::string& json_content) {
    try {
        auto jv = json::parse(json_content);
        if (!jv.is_object()) {
            return std::unexpected(ConfigError::PARSE_ERROR);
        }
        auto& root = jv.as_object();

        GatewayConfig config;

        if (auto* server = jsection(root, "server")) {
            config.server.bind_address = jstr(*server, "bind", config.server.bind_address);
            auto port = juint(*server, "port", config.server.port);
            if (port == 0 || port > 65535) {
                return std::unexpected(ConfigError::INVALID_VALUE);
            }
            config.server.port = static_cast<uint16_t>(port);
            config.server.num_threads = static_cast<size_t>(juint(*server, "threads", config.server.num_threads));
        }

        if (auto* upstream = jsection(root, "upstream")) {
            config.upstream.url = jstr(*upstream, "url", config.upstream.url);
            config.upstream.model = jstr(*upstream, "model", config.upstream.model);
            config.upstream.system_instruction =
                jstr(*upstream, "system_instruction", config.upstream.system_instruction);
        }

        if (auto* auth = jsection(root, "auth")) {
            config.auth.oauth_scope = jstr(*auth, "oauth_scope", config.auth.oauth_scope);
            config.auth.access_token = jstr(*auth, "access_token");
            config.auth.api_key_present = !jstr(*auth, "api_key").empty();
            config.auth.credentials_file = jstr(*auth, "credentials_file");
            config.auth.client_email = jstr(*auth, "client_email");
            config.auth.private_key = expand_newlines(jstr(*auth, "private_key"));
            config.auth.token_uri = jstr(*auth, "token_uri", config.auth.token_uri);
        }

        if (auto* relay = jsection(root, "relay")) {
            config.relay.pre_ready_capacity =
                static_cast<size_t>(juint(*relay, "pre_ready_capacity", config.relay.pre_ready_capacity));
        }

        if (auto* log = jsection(root, "log")) {
            config.log_level = jstr(*log, "level", config.log_level);
            config.log_file = jstr(*log, "file");
        }

        return config;

    } catch (const std::exception& e) {
        NLOG_ERROR(log::CONFIG_LOGGER, "Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }
}

std::expected<GatewayConfig, ConfigError> GatewayConfig::load_from_env() {
    GatewayConfig config;
    if (auto applied = config.apply_env(process_env()); !applied) {
        return std::unexpected(applied.error());
    }
    return config;
}

std::expected<void, ConfigError> GatewayConfig::apply_env(const EnvLookup& env) {
    if (auto port = env("PORT")) {
        uint32_t value = 0;
        if (!parse_number(*port, value) || value == 0 || value > 65535) {
            NLOG_ERROR(log::CONFIG_LOGGER, "Invalid PORT: {}", *port);
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
        server.port = static_cast<uint16_t>(value);
    }
    if (auto bind = env("LIVEGATE_LISTEN_ADDRESS")) {
        server.bind_address = *bind;
    }
    if (auto threads = env("LIVEGATE_THREADS")) {
        if (!parse_number(*threads, server.num_threads)) {
            NLOG_ERROR(log::CONFIG_LOGGER, "Invalid LIVEGATE_THREADS: {}", *threads);
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
    }

    if (auto url = env("GEMINI_WS_URL")) upstream.url = *url;
    if (auto model = env("GEMINI_MODEL")) upstream.model = *model;
    if (auto instruction = env("GEMINI_SYSTEM_INSTRUCTION")) upstream.system_instruction = *instruction;

    if (auto scope = env("GEMINI_OAUTH_SCOPE"); scope && !scope->empty()) auth.oauth_scope = *scope;
    if (auto token = env("GEMINI_ACCESS_TOKEN")) auth.access_token = *token;
    if (auto key = env("GEMINI_API_KEY"); key && !key->empty()) auth.api_key_present = true;
    if (auto file = env("GOOGLE_APPLICATION_CREDENTIALS")) auth.credentials_file = *file;
    if (auto email = env("GOOGLE_CLIENT_EMAIL")) auth.client_email = *email;
    if (auto key = env("GOOGLE_PRIVATE_KEY")) auth.private_key = expand_newlines(*key);

    if (auto capacity = env("LIVEGATE_PRE_READY_CAPACITY")) {
        if (!parse_number(*capacity, relay.pre_ready_capacity)) {
            NLOG_ERROR(log::CONFIG_LOGGER, "Invalid LIVEGATE_PRE_READY_CAPACITY: {}", *capacity);
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
    }

    if (auto level = env("LIVEGATE_LOG_LEVEL")) {
        log_level = *level;
    } else if (auto fallback = env("LOG_LEVEL")) {
        log_level = *fallback;
    }
    if (auto file = env("LIVEGATE_LOG_FILE")) log_file = *file;

    return {};
}

} // namespace livegate
