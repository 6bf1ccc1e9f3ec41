#include "common/http_client.hpp"
#include "common/log.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/use_future.hpp>
#include <openssl/err.h>
#include <cctype>
#include <regex>

namespace livegate {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

std::optional<UrlComponents> parse_url(const std::string& url) {
    // Pattern: scheme://host[:port][/path][?query]
    static const std::regex url_regex(R"(^(https?|wss?)://([^:/?]+)(?::(\d+))?([/?].*)?$)");
    std::smatch match;

    if (!std::regex_match(url, match, url_regex)) {
        return std::nullopt;
    }

    UrlComponents parts;
    parts.scheme = match[1].str();
    parts.use_ssl = (parts.scheme == "https" || parts.scheme == "wss");
    parts.host = match[2].str();
    parts.port = match[3].matched ? match[3].str() : (parts.use_ssl ? "443" : "80");
    parts.target = match[4].matched ? match[4].str() : "/";
    if (parts.target.front() == '?') {
        parts.target.insert(parts.target.begin(), '/');
    }

    return parts;
}

std::string form_urlencode(std::string_view value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

namespace {

template<typename Stream>
net::awaitable<HttpResult> exchange(Stream& stream, const http::request<http::string_body>& req) {
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res, net::use_awaitable);

    co_return HttpResult{res.result_int(), std::move(res.body())};
}

// tcp_stream timeouts only apply to async operations, so the blocking
// request runs as a coroutine on a private io_context.
net::awaitable<HttpResult> do_request(const UrlComponents& url,
                                      const http::request<http::string_body>& req,
                                      std::chrono::seconds timeout) {
    auto executor = co_await net::this_coro::executor;

    tcp::resolver resolver(executor);
    auto endpoints = co_await resolver.async_resolve(url.host, url.port, net::use_awaitable);

    if (url.use_ssl) {
        ssl::context ctx{ssl::context::tlsv12_client};
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(executor, ctx);

        // Set SNI hostname
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            throw boost::system::system_error(
                boost::system::error_code(
                    static_cast<int>(::ERR_get_error()),
                    net::error::get_ssl_category()));
        }
        stream.set_verify_callback(ssl::host_name_verification(url.host));

        beast::get_lowest_layer(stream).expires_after(timeout);
        co_await beast::get_lowest_layer(stream).async_connect(endpoints, net::use_awaitable);
        co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

        auto result = co_await exchange(stream, req);

        // Servers commonly skip close_notify
        beast::error_code ec;
        co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
        co_return result;
    }

    beast::tcp_stream stream(executor);
    stream.expires_after(timeout);
    co_await stream.async_connect(endpoints, net::use_awaitable);

    auto result = co_await exchange(stream, req);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return result;
}

} // anonymous namespace

Result<HttpResult> http_request(const HttpRequestSpec& spec) {
    auto url = parse_url(spec.url);
    if (!url) {
        return make_error(ErrorCode::HTTP_ERROR, "Invalid URL: " + spec.url);
    }

    http::request<http::string_body> req{http::string_to_verb(spec.method), url->target, 11};
    req.set(http::field::host, url->host);
    req.set(http::field::user_agent, "LiveGate/1.0");
    for (const auto& [name, value] : spec.headers) {
        req.set(name, value);
    }
    if (!spec.body.empty() || spec.method == "POST") {
        if (!spec.content_type.empty()) {
            req.set(http::field::content_type, spec.content_type);
        }
        req.body() = spec.body;
        req.prepare_payload();
    }

    try {
        net::io_context ioc;
        auto future = net::co_spawn(ioc, do_request(*url, req, spec.timeout), net::use_future);
        ioc.run();
        return future.get();

    } catch (const boost::system::system_error& e) {
        NLOG_DEBUG(log::AUTH_LOGGER, "HTTP {} {} failed: {}", spec.method, spec.url, e.what());
        return make_error(ErrorCode::HTTP_ERROR, e.what());
    }
}

} // namespace livegate
