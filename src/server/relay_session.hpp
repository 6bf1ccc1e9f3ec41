#pragma once

#include "common/error.hpp"
#include "common/live_protocol.hpp"
#include "common/message_channel.hpp"
#include "server/handshake_controller.hpp"
#include "server/pre_ready_buffer.hpp"
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <functional>
#include <memory>
#include <string>

namespace livegate {

namespace net = boost::asio;

/**
 * RelaySession - one browser client bridged to one upstream Live session
 *
 * Lifecycle:
 *   CONNECTING  -> obtain the upstream channel
 *   HANDSHAKING -> setup message sent
 *   BUFFERING   -> client audio parked in the pre-ready buffer
 *   READY       -> setupComplete seen, buffer drained upstream
 *   RELAYING    -> audio forwarded as it arrives
 *   CLOSING     -> one pump ended, both legs being closed
 *   CLOSED
 *
 * Both pumps and run() execute on the same executor, which must not be
 * multi-threaded. Sends never suspend, so the ready transition and the
 * drain happen without the client pump interleaving.
 */
class RelaySession : public std::enable_shared_from_this<RelaySession> {
public:
    enum class State {
        CONNECTING,
        HANDSHAKING,
        BUFFERING,
        READY,
        RELAYING,
        CLOSING,
        CLOSED,
    };

    using Connector = std::function<net::awaitable<Result<std::shared_ptr<MessageChannel>>>()>;

    struct Options {
        upstream::SetupParams setup;
        size_t pre_ready_capacity{PreReadyBuffer::kDefaultCapacity};
    };

    RelaySession(net::any_io_executor executor,
                 std::shared_ptr<MessageChannel> client,
                 Connector connector,
                 Options options);

    RelaySession(const RelaySession&) = delete;
    RelaySession& operator=(const RelaySession&) = delete;

    /**
     * Drive the session to completion. Returns once both legs are closed
     * and both pumps have exited. Never throws for peer or upstream failures.
     */
    net::awaitable<void> run();

    State state() const { return state_; }
    bool is_ready() const { return handshake_.is_ready(); }
    const PreReadyBuffer& pre_ready_buffer() const { return buffer_; }
    uint64_t id() const { return id_; }

private:
    net::awaitable<void> client_pump();
    net::awaitable<void> upstream_pump();

    void spawn_pump(net::awaitable<void> (RelaySession::*pump)(), const char* name);

    void handle_client_message(const ChannelMessage& message, bool& stop);
    void handle_upstream_event(const upstream::ServerEvent& event);

    void send_audio(std::string pcm);
    void send_control(const client::ControlMessage& message);

    // First caller wins; later calls are no-ops
    void trigger_shutdown(const char* reason);

    static const char* state_name(State state);
    void set_state(State state);

    uint64_t id_;
    net::any_io_executor executor_;
    std::shared_ptr<MessageChannel> client_;
    std::shared_ptr<MessageChannel> upstream_;
    Connector connector_;

    HandshakeController handshake_;
    PreReadyBuffer buffer_;
    State state_{State::CONNECTING};

    // One-shot completion signal
    bool shutdown_{false};
    net::steady_timer shutdown_signal_;

    int active_pumps_{0};
    net::steady_timer pumps_done_;

    uint64_t audio_in_{0};
    uint64_t audio_out_{0};
};

} // namespace livegate
