#include "common/live_protocol.hpp"
#include "common/base64.hpp"
#include "common/log.hpp"

namespace json = boost::json;

namespace livegate {

namespace {

// Loose truthiness: the upstream sometimes sends {} or false for absent flags
bool truthy(const json::value& v) {
    switch (v.kind()) {
        case json::kind::null: return false;
        case json::kind::bool_: return v.get_bool();
        case json::kind::int64: return v.get_int64() != 0;
        case json::kind::uint64: return v.get_uint64() != 0;
        case json::kind::double_: return v.get_double() != 0.0;
        case json::kind::string: return !v.get_string().empty();
        case json::kind::array: return !v.get_array().empty();
        case json::kind::object: return !v.get_object().empty();
    }
    return false;
}

const json::value* jfield(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end()) {
        return &it->value();
    }
    return nullptr;
}

const json::object* jsection(const json::object& obj, std::string_view key) {
    if (auto* v = jfield(obj, key); v && v->is_object()) {
        return &v->get_object();
    }
    return nullptr;
}

std::optional<json::object> parse_object(std::string_view text) {
    json::error_code ec;
    auto jv = json::parse(text, ec);
    if (ec || !jv.is_object()) {
        return std::nullopt;
    }
    return std::move(jv.as_object());
}

} // anonymous namespace

// ============================================================================
// Client control messages
// ============================================================================

namespace client {

namespace {

struct Serializer {
    json::object operator()(const Ready&) const {
        return {{"type", "ready"}};
    }
    json::object operator()(const Error& e) const {
        json::object obj{{"type", "error"}, {"message", e.message}};
        if (e.details) {
            obj["details"] = *e.details;
        }
        return obj;
    }
    json::object operator()(const Interrupted&) const {
        return {{"type", "interrupted"}};
    }
    json::object operator()(const TurnComplete&) const {
        return {{"type", "turn_complete"}};
    }
};

} // anonymous namespace

std::string serialize(const ControlMessage& message) {
    return json::serialize(std::visit(Serializer{}, message));
}

std::optional<Command> parse_command(std::string_view text) {
    auto obj = parse_object(text);
    if (!obj) {
        NLOG_TRACE(log::RELAY_LOGGER, "Ignoring non-JSON client text ({} bytes)", text.size());
        return std::nullopt;
    }

    auto* type = jfield(*obj, "type");
    if (type && type->is_string() && type->get_string() == "stop") {
        return Command::STOP;
    }
    return std::nullopt;
}

} // namespace client

// ============================================================================
// Upstream messages
// ============================================================================

namespace upstream {

std::string build_setup_message(const SetupParams& params) {
    json::object text_part{{"text", params.system_instruction}};

    json::object setup;
    setup["model"] = params.model;
    setup["generationConfig"] = json::object{
        {"responseModalities", json::array{"AUDIO"}}};
    setup["systemInstruction"] = json::object{
        {"parts", json::array{std::move(text_part)}}};
    setup["realtimeInputConfig"] = json::object{
        {"activityHandling", ACTIVITY_HANDLING}};

    json::object root;
    root["setup"] = std::move(setup);
    return json::serialize(root);
}

std::string build_audio_input_message(std::string_view pcm) {
    json::object audio{
        {"mimeType", AUDIO_MIME_TYPE},
        {"data", base64_encode(pcm)}};

    json::object root;
    root["realtimeInput"] = json::object{{"audio", std::move(audio)}};
    return json::serialize(root);
}

std::string build_audio_stream_end_message() {
    json::object root;
    root["realtimeInput"] = json::object{{"audioStreamEnd", true}};
    return json::serialize(root);
}

std::optional<ServerEvent> parse_server_message(std::string_view text) {
    auto obj = parse_object(text);
    if (!obj) {
        return std::nullopt;
    }

    ServerEvent event;
    event.setup_complete = obj->contains("setupComplete");

    if (auto* err = jfield(*obj, "error"); err && truthy(*err)) {
        event.error = *err;
    } else if (auto* status = jfield(*obj, "rpcStatus"); status && truthy(*status)) {
        event.error = *status;
    }

    auto* content = jsection(*obj, "serverContent");
    if (!content) {
        return event;
    }

    if (auto* v = jfield(*content, "interrupted")) {
        event.interrupted = truthy(*v);
    }

    if (auto* turn = jsection(*content, "modelTurn")) {
        if (auto* parts = jfield(*turn, "parts"); parts && parts->is_array()) {
            for (const auto& part : parts->get_array()) {
                if (!part.is_object()) {
                    continue;
                }
                const auto& p = part.get_object();
                auto* inline_data = jsection(p, "inlineData");
                if (!inline_data) {
                    inline_data = jsection(p, "inline_data");
                }
                if (!inline_data) {
                    continue;
                }
                if (auto* data = jfield(*inline_data, "data");
                    data && data->is_string() && !data->get_string().empty()) {
                    event.audio_parts.emplace_back(data->get_string());
                }
            }
        }
    }

    if (auto* v = jfield(*content, "turnComplete")) {
        event.turn_complete = truthy(*v);
    }

    return event;
}

} // namespace upstream

} // namespace livegate
