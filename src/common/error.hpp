#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace livegate {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    CONFIGURATION_ERROR,    // Credential mode incompatible with the upstream transport
    AUTH_ERROR,             // Token refresh failed or produced an empty token
    CONNECT_ERROR,          // Upstream unreachable or handshake rejected
    PROTOCOL_DECODE_ERROR,  // Malformed JSON / base64 from a peer
    HTTP_ERROR,             // Transport failure talking to an identity endpoint
};

constexpr std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONFIGURATION_ERROR: return "CONFIGURATION_ERROR";
        case ErrorCode::AUTH_ERROR: return "AUTH_ERROR";
        case ErrorCode::CONNECT_ERROR: return "CONNECT_ERROR";
        case ErrorCode::PROTOCOL_DECODE_ERROR: return "PROTOCOL_DECODE_ERROR";
        case ErrorCode::HTTP_ERROR: return "HTTP_ERROR";
    }
    return "UNKNOWN";
}

struct Error {
    ErrorCode code;
    std::string message;
};

template<typename T>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> make_error(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace livegate
