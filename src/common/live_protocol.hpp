#pragma once

#include <boost/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace livegate {

// ============================================================================
// Client-facing control messages (text frames)
// ============================================================================

namespace client {

struct Ready {};

struct Error {
    std::string message;
    std::optional<boost::json::value> details;
};

struct Interrupted {};

struct TurnComplete {};

using ControlMessage = std::variant<Ready, Error, Interrupted, TurnComplete>;

std::string serialize(const ControlMessage& message);

// Commands the client may send
enum class Command {
    STOP,
};

// Malformed JSON and unknown types yield std::nullopt
std::optional<Command> parse_command(std::string_view text);

} // namespace client

// ============================================================================
// Upstream (Live API) messages
// ============================================================================

namespace upstream {

constexpr const char* AUDIO_MIME_TYPE = "audio/pcm;rate=16000";
constexpr const char* ACTIVITY_HANDLING = "START_OF_ACTIVITY_INTERRUPTS";

struct SetupParams {
    std::string model;
    std::string system_instruction;
};

std::string build_setup_message(const SetupParams& params);

std::string build_audio_input_message(std::string_view pcm);

std::string build_audio_stream_end_message();

// Field-presence view of one server message. Unknown fields are ignored.
struct ServerEvent {
    bool setup_complete{false};
    std::optional<boost::json::value> error;   // "error" or "rpcStatus"
    bool interrupted{false};
    std::vector<std::string> audio_parts;      // base64, in part order
    bool turn_complete{false};
};

// Non-JSON or non-object text yields std::nullopt
std::optional<ServerEvent> parse_server_message(std::string_view text);

} // namespace upstream

} // namespace livegate
