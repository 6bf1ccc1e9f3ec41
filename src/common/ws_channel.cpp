#include "common/ws_channel.hpp"
#include "common/log.hpp"
#include <algorithm>

namespace livegate {

WsChannel::WsChannel(std::unique_ptr<WsStream> ws, std::string name, WsChannelLimits limits)
    : ws_(std::move(ws))
    , name_(std::move(name))
    , limits_(limits)
    , write_signal_(ws_->get_executor())
    , writer_done_(ws_->get_executor())
{}

WsChannel::WsChannel(std::unique_ptr<WssStream> wss, std::shared_ptr<ssl::context> ssl_ctx,
                     std::string name, WsChannelLimits limits)
    : ssl_ctx_(std::move(ssl_ctx))
    , wss_(std::move(wss))
    , name_(std::move(name))
    , limits_(limits)
    , write_signal_(wss_->get_executor())
    , writer_done_(wss_->get_executor())
{}

WsChannel::~WsChannel() = default;

net::any_io_executor WsChannel::executor() const {
    return wss_ ? wss_->get_executor() : ws_->get_executor();
}

bool WsChannel::is_open() const {
    return wss_ ? wss_->is_open() : ws_->is_open();
}

void WsChannel::start() {
    writer_running_ = true;
    net::co_spawn(
        executor(),
        [self = shared_from_this()]() -> net::awaitable<void> {
            co_await self->writer();
        },
        [name = name_](std::exception_ptr ep) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    LOG_ERROR("{}: Writer exception: {}", name, e.what());
                }
            }
        });
}

void WsChannel::send_text(std::string text) {
    enqueue_send(std::move(text), true);
}

void WsChannel::send_binary(std::string data) {
    enqueue_send(std::move(data), false);
}

void WsChannel::enqueue_send(std::string data, bool is_text) {
    if (closing_ || failed_) {
        LOG_TRACE("{}: Dropping {} byte send on closing channel", name_, data.size());
        return;
    }
    if (!is_text && queued_bytes_ + data.size() > limits_.max_queued_bytes) {
        if (stats_.binary_dropped++ == 0) {
            LOG_WARN("{}: Peer is not keeping up, dropping audio", name_);
        }
        LOG_TRACE("{}: Dropped {} byte frame ({} bytes queued)", name_, data.size(), queued_bytes_);
        return;
    }
    queued_bytes_ += data.size();
    write_queue_.push_back({std::move(data), is_text});
    write_signal_.cancel();  // Wake up writer coroutine
}

void WsChannel::close_socket() {
    if (wss_) {
        beast::get_lowest_layer(*wss_).close();
    } else {
        beast::get_lowest_layer(*ws_).close();
    }
}

void WsChannel::abort() {
    beast::error_code ec;
    if (wss_) {
        beast::get_lowest_layer(*wss_).socket().cancel(ec);
    } else {
        beast::get_lowest_layer(*ws_).socket().cancel(ec);
    }
}

net::awaitable<std::optional<ChannelMessage>> WsChannel::receive() {
    if (closed_ || failed_) {
        co_return std::nullopt;
    }

    read_buffer_.clear();

    beast::error_code ec;
    size_t bytes = 0;
    bool text = false;

    if (wss_) {
        bytes = co_await wss_->async_read(read_buffer_, net::redirect_error(net::use_awaitable, ec));
        text = wss_->got_text();
    } else {
        bytes = co_await ws_->async_read(read_buffer_, net::redirect_error(net::use_awaitable, ec));
        text = ws_->got_text();
    }

    if (ec) {
        if (ec == websocket::error::closed) {
            LOG_DEBUG("{}: Peer closed", name_);
        } else if (ec != net::error::operation_aborted) {
            LOG_DEBUG("{}: Read ended: {}", name_, ec.message());
        }
        co_return std::nullopt;
    }

    stats_.messages_received++;
    stats_.bytes_received += bytes;

    ChannelMessage message;
    message.kind = text ? ChannelMessage::Kind::TEXT : ChannelMessage::Kind::BINARY;
    message.data = beast::buffers_to_string(read_buffer_.data());
    co_return message;
}

net::awaitable<void> WsChannel::writer() {
    while (true) {
        // Wait for data or close signal
        while (write_queue_.empty() && !closing_ && !failed_) {
            write_signal_.expires_at(net::steady_timer::time_point::max());

            beast::error_code ec;
            co_await write_signal_.async_wait(net::redirect_error(net::use_awaitable, ec));
            // ec is operation_aborted when woken for new data or close
        }

        if (failed_ || write_queue_.empty()) {
            break;  // Closing and fully flushed
        }

        auto item = std::move(write_queue_.front());
        write_queue_.pop_front();
        queued_bytes_ -= item.data.size();

        beast::error_code ec;
        if (wss_) {
            wss_->binary(!item.is_text);
            co_await wss_->async_write(net::buffer(item.data), net::redirect_error(net::use_awaitable, ec));
        } else {
            ws_->binary(!item.is_text);
            co_await ws_->async_write(net::buffer(item.data), net::redirect_error(net::use_awaitable, ec));
        }

        if (ec) {
            LOG_DEBUG("{}: Write failed: {}", name_, ec.message());
            failed_ = true;
            write_queue_.clear();
            queued_bytes_ = 0;
            abort();
            break;
        }

        stats_.messages_sent++;
        stats_.bytes_sent += item.data.size();
    }

    writer_running_ = false;
    writer_done_.cancel();
}

net::awaitable<void> WsChannel::close() {
    if (closed_) {
        co_return;
    }
    closing_ = true;
    write_signal_.cancel();

    // Let the writer flush what is already queued, up to the close timeout
    auto deadline = net::steady_timer::clock_type::now() + limits_.close_timeout;
    while (writer_running_) {
        writer_done_.expires_at(failed_ ? net::steady_timer::time_point::max() : deadline);
        beast::error_code ec;
        co_await writer_done_.async_wait(net::redirect_error(net::use_awaitable, ec));

        if (!ec && writer_running_) {
            LOG_DEBUG("{}: Flush timed out with {} bytes queued, dropping connection",
                      name_, queued_bytes_);
            failed_ = true;
            close_socket();
        }
    }

    closed_ = true;

    if (!failed_ && is_open()) {
        // Applies to the close handshake
        websocket::stream_base::timeout opt{};
        opt.handshake_timeout = std::max(deadline - net::steady_timer::clock_type::now(),
                                         net::steady_timer::duration::zero());
        opt.idle_timeout = websocket::stream_base::none();
        opt.keep_alive_pings = false;

        beast::error_code ec;
        if (wss_) {
            wss_->set_option(opt);
            co_await wss_->async_close(websocket::close_code::normal,
                                       net::redirect_error(net::use_awaitable, ec));
        } else {
            ws_->set_option(opt);
            co_await ws_->async_close(websocket::close_code::normal,
                                      net::redirect_error(net::use_awaitable, ec));
        }
        if (ec) {
            LOG_TRACE("{}: Close handshake failed: {}", name_, ec.message());
        }
    }

    beast::error_code ec;
    if (wss_) {
        beast::get_lowest_layer(*wss_).socket().close(ec);
    } else {
        beast::get_lowest_layer(*ws_).socket().close(ec);
    }

    LOG_DEBUG("{}: Closed (sent {} msgs / {} bytes, received {} msgs / {} bytes, dropped {} frames)",
              name_, stats_.messages_sent, stats_.bytes_sent,
              stats_.messages_received, stats_.bytes_received, stats_.binary_dropped);
}

} // namespace livegate
