#pragma once

#include "common/message_channel.hpp"
#include <boost/asio.hpp>
#include <deque>
#include <string>
#include <vector>

namespace livegate::test {

namespace net = boost::asio;

/**
 * MessageChannel fake for driving a RelaySession from a test.
 *
 * push_*() feeds messages the peer "sent"; sent() records what the
 * session wrote. All calls must happen on the io_context thread.
 */
class InMemoryChannel : public MessageChannel {
public:
    InMemoryChannel(net::any_io_executor executor, std::string name)
        : signal_(executor)
        , name_(std::move(name))
    {}

    // Peer side

    void push_text(std::string text) {
        inbox_.push_back({ChannelMessage::Kind::TEXT, std::move(text)});
        signal_.cancel();
    }

    void push_binary(std::string data) {
        inbox_.push_back({ChannelMessage::Kind::BINARY, std::move(data)});
        signal_.cancel();
    }

    void peer_close() {
        peer_closed_ = true;
        signal_.cancel();
    }

    const std::vector<ChannelMessage>& sent() const { return sent_; }

    std::vector<std::string> sent_text() const {
        std::vector<std::string> out;
        for (const auto& m : sent_) {
            if (m.is_text()) out.push_back(m.data);
        }
        return out;
    }

    std::vector<std::string> sent_binary() const {
        std::vector<std::string> out;
        for (const auto& m : sent_) {
            if (m.is_binary()) out.push_back(m.data);
        }
        return out;
    }

    bool closed() const { return closed_; }
    int close_calls() const { return close_calls_; }

    // MessageChannel

    net::awaitable<std::optional<ChannelMessage>> receive() override {
        while (true) {
            if (closed_) {
                co_return std::nullopt;
            }
            if (!inbox_.empty()) {
                auto message = std::move(inbox_.front());
                inbox_.pop_front();
                co_return message;
            }
            if (peer_closed_) {
                co_return std::nullopt;
            }
            signal_.expires_at(net::steady_timer::time_point::max());
            boost::system::error_code ec;
            co_await signal_.async_wait(net::redirect_error(net::use_awaitable, ec));
        }
    }

    void send_text(std::string text) override {
        if (!closed_) {
            sent_.push_back({ChannelMessage::Kind::TEXT, std::move(text)});
        }
    }

    void send_binary(std::string data) override {
        if (!closed_) {
            sent_.push_back({ChannelMessage::Kind::BINARY, std::move(data)});
        }
    }

    net::awaitable<void> close() override {
        ++close_calls_;
        closed_ = true;
        signal_.cancel();
        co_return;
    }

    std::string description() const override { return name_; }

private:
    net::steady_timer signal_;
    std::string name_;
    std::deque<ChannelMessage> inbox_;
    std::vector<ChannelMessage> sent_;
    bool peer_closed_{false};
    bool closed_{false};
    int close_calls_{0};
};

} // namespace livegate::test
