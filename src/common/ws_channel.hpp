#pragma once

#include "common/message_channel.hpp"
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <string>

namespace livegate {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

struct WsChannelLimits {
    // Binary frames that would push the queued bytes past this are dropped
    size_t max_queued_bytes{4 * 1024 * 1024};

    // Bound on close(): flushing the queue, then the close handshake
    std::chrono::milliseconds close_timeout{std::chrono::seconds(30)};
};

/**
 * WsChannel - MessageChannel over an established WebSocket
 *
 * Wraps either a plain or a TLS WebSocket stream whose handshake has
 * already completed (server accept or client connect). A writer coroutine
 * owns all writes; receive() is driven by the caller.
 *
 * Audio is lossy under backpressure: binary sends past
 * WsChannelLimits::max_queued_bytes are dropped and counted. Text frames
 * are always queued.
 *
 * Not thread-safe: all calls must happen on the stream's executor.
 */
class WsChannel : public MessageChannel, public std::enable_shared_from_this<WsChannel> {
public:
    using WsStream = websocket::stream<beast::tcp_stream>;
    using WssStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    WsChannel(std::unique_ptr<WsStream> ws, std::string name, WsChannelLimits limits = {});

    // ssl_ctx must be the context the stream was built with
    WsChannel(std::unique_ptr<WssStream> wss, std::shared_ptr<ssl::context> ssl_ctx, std::string name,
              WsChannelLimits limits = {});

    ~WsChannel() override;

    WsChannel(const WsChannel&) = delete;
    WsChannel& operator=(const WsChannel&) = delete;

    /**
     * Spawn the writer coroutine. Must be called once before sending.
     */
    void start();

    net::awaitable<std::optional<ChannelMessage>> receive() override;
    void send_text(std::string text) override;
    void send_binary(std::string data) override;
    net::awaitable<void> close() override;
    std::string description() const override { return name_; }

    /**
     * Statistics for the session summary log line.
     */
    struct Stats {
        uint64_t messages_sent{0};
        uint64_t messages_received{0};
        uint64_t bytes_sent{0};
        uint64_t bytes_received{0};
        uint64_t binary_dropped{0};
    };
    const Stats& stats() const { return stats_; }

private:
    net::awaitable<void> writer();

    void enqueue_send(std::string data, bool is_text);

    // Cancel pending socket operations after a failure
    void abort();

    // Close the TCP socket outright, failing any pending operation
    void close_socket();

    bool is_open() const;

    net::any_io_executor executor() const;

    std::shared_ptr<ssl::context> ssl_ctx_;  // Outlives wss_
    std::unique_ptr<WssStream> wss_;
    std::unique_ptr<WsStream> ws_;
    std::string name_;
    WsChannelLimits limits_;

    struct WriteItem {
        std::string data;
        bool is_text{false};
    };
    std::deque<WriteItem> write_queue_;
    size_t queued_bytes_{0};
    net::steady_timer write_signal_;   // Wakes the writer
    net::steady_timer writer_done_;    // Wakes close() once the writer exits

    beast::flat_buffer read_buffer_;

    bool writer_running_{false};
    bool closing_{false};
    bool closed_{false};
    bool failed_{false};

    Stats stats_;
};

} // namespace livegate
