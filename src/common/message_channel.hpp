#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <optional>
#include <string>

namespace livegate {

namespace net = boost::asio;

/**
 * One message read from a channel. Text frames carry control JSON,
 * binary frames carry raw audio.
 */
struct ChannelMessage {
    enum class Kind { TEXT, BINARY };

    Kind kind{Kind::TEXT};
    std::string data;

    bool is_text() const { return kind == Kind::TEXT; }
    bool is_binary() const { return kind == Kind::BINARY; }
};

/**
 * MessageChannel - one leg of a relay session
 *
 * Sends are queued in call order and written by the channel itself, so
 * callers never suspend on send. A failed write tears the channel down,
 * which the reader observes as end of stream.
 */
class MessageChannel {
public:
    virtual ~MessageChannel() = default;

    /**
     * Wait for the next message.
     * @return std::nullopt once the peer closed or the channel failed
     */
    virtual net::awaitable<std::optional<ChannelMessage>> receive() = 0;

    virtual void send_text(std::string text) = 0;

    virtual void send_binary(std::string data) = 0;

    /**
     * Flush queued sends and close. Never throws; safe to call twice.
     * Aborts a receive() pending on the same channel.
     */
    virtual net::awaitable<void> close() = 0;

    virtual std::string description() const = 0;
};

} // namespace livegate
