#include "server/relay_session.hpp"
#include "common/base64.hpp"
#include "common/log.hpp"
#include <atomic>

namespace livegate {

namespace {

std::atomic<uint64_t> next_session_id{1};

constexpr const char* UPSTREAM_ERROR_MESSAGE = "Gemini error";
constexpr const char* CONNECT_FAILED_MESSAGE = "Gemini connection failed";

} // anonymous namespace

RelaySession::RelaySession(net::any_io_executor executor,
                           std::shared_ptr<MessageChannel> client,
                           Connector connector,
                           Options options)
    : id_(next_session_id.fetch_add(1, std::memory_order_relaxed))
    , executor_(std::move(executor))
    , client_(std::move(client))
    , connector_(std::move(connector))
    , handshake_(std::move(options.setup))
    , buffer_(options.pre_ready_capacity)
    , shutdown_signal_(executor_)
    , pumps_done_(executor_)
{}

const char* RelaySession::state_name(State state) {
    switch (state) {
        case State::CONNECTING: return "CONNECTING";
        case State::HANDSHAKING: return "HANDSHAKING";
        case State::BUFFERING: return "BUFFERING";
        case State::READY: return "READY";
        case State::RELAYING: return "RELAYING";
        case State::CLOSING: return "CLOSING";
        case State::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

void RelaySession::set_state(State state) {
    NLOG_TRACE(log::RELAY_LOGGER, "Session {}: {} -> {}", id_, state_name(state_), state_name(state));
    state_ = state;
}

// ============================================================================
// Session driver
// ============================================================================

net::awaitable<void> RelaySession::run() {
    NLOG_INFO(log::RELAY_LOGGER, "Session {}: Started for {}", id_, client_->description());

    set_state(State::CONNECTING);
    auto connected = co_await connector_();
    if (!connected) {
        NLOG_WARN(log::RELAY_LOGGER, "Session {}: Upstream unavailable ({}): {}", id_,
                  error_code_name(connected.error().code), connected.error().message);

        set_state(State::CLOSING);
        const auto& reason = connected.error().message;
        send_control(client::Error{reason.empty() ? CONNECT_FAILED_MESSAGE : reason, std::nullopt});
        co_await client_->close();
        set_state(State::CLOSED);
        co_return;
    }
    upstream_ = std::move(*connected);

    set_state(State::HANDSHAKING);
    upstream_->send_text(handshake_.build_setup_message());
    NLOG_DEBUG(log::RELAY_LOGGER, "Session {}: Sent setup", id_);

    set_state(State::BUFFERING);
    spawn_pump(&RelaySession::client_pump, "client->upstream");
    spawn_pump(&RelaySession::upstream_pump, "upstream->client");

    // Wait for the first pump to finish
    while (!shutdown_) {
        shutdown_signal_.expires_at(net::steady_timer::time_point::max());
        boost::system::error_code ec;
        co_await shutdown_signal_.async_wait(net::redirect_error(net::use_awaitable, ec));
    }

    set_state(State::CLOSING);

    // Closing a channel aborts the receive the other pump is blocked in
    co_await upstream_->close();
    co_await client_->close();

    while (active_pumps_ > 0) {
        pumps_done_.expires_at(net::steady_timer::time_point::max());
        boost::system::error_code ec;
        co_await pumps_done_.async_wait(net::redirect_error(net::use_awaitable, ec));
    }

    set_state(State::CLOSED);
    NLOG_INFO(log::RELAY_LOGGER, "Session {}: Closed (audio in {} / out {}, {} chunks dropped before ready)",
              id_, audio_in_, audio_out_, buffer_.dropped());
}

void RelaySession::spawn_pump(net::awaitable<void> (RelaySession::*pump)(), const char* name) {
    ++active_pumps_;
    net::co_spawn(
        executor_,
        [self = shared_from_this(), pump]() -> net::awaitable<void> {
            co_await ((*self).*pump)();
        },
        [self = shared_from_this(), name](std::exception_ptr ep) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    NLOG_ERROR(log::RELAY_LOGGER, "Session {}: {} pump exception: {}", self->id_, name, e.what());
                }
            }
            self->trigger_shutdown(name);
            --self->active_pumps_;
            self->pumps_done_.cancel();
        });
}

void RelaySession::trigger_shutdown(const char* reason) {
    if (shutdown_) {
        return;
    }
    NLOG_DEBUG(log::RELAY_LOGGER, "Session {}: Shutdown triggered by {} pump", id_, reason);
    shutdown_ = true;
    shutdown_signal_.cancel();
}

// ============================================================================
// Client -> upstream
// ============================================================================

net::awaitable<void> RelaySession::client_pump() {
    bool stop = false;
    while (!shutdown_ && !stop) {
        auto message = co_await client_->receive();
        if (!message) {
            NLOG_DEBUG(log::RELAY_LOGGER, "Session {}: Client disconnected", id_);
            break;
        }
        handle_client_message(*message, stop);
    }
}

void RelaySession::handle_client_message(const ChannelMessage& message, bool& stop) {
    if (message.is_binary()) {
        if (!handshake_.is_ready()) {
            buffer_.offer(message.data);
            return;
        }
        send_audio(message.data);
        return;
    }

    auto command = client::parse_command(message.data);
    if (command == client::Command::STOP) {
        NLOG_DEBUG(log::RELAY_LOGGER, "Session {}: Client requested stop", id_);
        upstream_->send_text(upstream::build_audio_stream_end_message());
        stop = true;
    }
}

void RelaySession::send_audio(std::string pcm) {
    ++audio_in_;
    upstream_->send_text(upstream::build_audio_input_message(pcm));
}

// ============================================================================
// Upstream -> client
// ============================================================================

net::awaitable<void> RelaySession::upstream_pump() {
    while (!shutdown_) {
        auto message = co_await upstream_->receive();
        if (!message) {
            NLOG_DEBUG(log::RELAY_LOGGER, "Session {}: Upstream closed", id_);
            break;
        }
        if (message->is_binary()) {
            continue;
        }

        auto event = upstream::parse_server_message(message->data);
        if (!event) {
            NLOG_TRACE(log::RELAY_LOGGER, "Session {}: Ignoring non-JSON upstream text", id_);
            continue;
        }
        handle_upstream_event(*event);
    }
}

void RelaySession::handle_upstream_event(const upstream::ServerEvent& event) {
    if (event.setup_complete) {
        if (!handshake_.mark_ready()) {
            NLOG_DEBUG(log::RELAY_LOGGER, "Session {}: Ignoring repeated setupComplete", id_);
            return;
        }
        set_state(State::READY);
        send_control(client::Ready{});
        auto drained = buffer_.drain_to([this](std::string chunk) { send_audio(std::move(chunk)); });
        NLOG_INFO(log::RELAY_LOGGER, "Session {}: Upstream ready, flushed {} buffered chunks", id_, drained);
        set_state(State::RELAYING);
        return;
    }

    if (event.error) {
        NLOG_WARN(log::RELAY_LOGGER, "Session {}: Upstream reported error: {}", id_,
                  boost::json::serialize(*event.error));
        send_control(client::Error{UPSTREAM_ERROR_MESSAGE, event.error});
    }

    if (event.interrupted) {
        send_control(client::Interrupted{});
    }

    for (const auto& part : event.audio_parts) {
        auto pcm = base64_decode(part);
        if (!pcm) {
            NLOG_TRACE(log::RELAY_LOGGER, "Session {}: Skipping undecodable audio part", id_);
            continue;
        }
        ++audio_out_;
        client_->send_binary(std::move(*pcm));
    }

    if (event.turn_complete) {
        send_control(client::TurnComplete{});
    }
}

void RelaySession::send_control(const client::ControlMessage& message) {
    client_->send_text(client::serialize(message));
}

} // namespace livegate
