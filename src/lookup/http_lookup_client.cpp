/**
 * @file http_lookup_client.cpp
 * @brief HttpLookupClient implementation.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#include "nsqsub/lookup/http_lookup_client.hpp"
#include "nsqsub/lookup/lookup_codec.hpp"
#include "nsqsub/utils/logger.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <cctype>
#include <memory>

namespace nsqsub {
namespace lookup {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace asio = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

// One request/response exchange. Lives on the I/O thread only.
class LookupExchange : public std::enable_shared_from_this<LookupExchange> {
public:
    LookupExchange(asio::io_context& io, HttpEndpoint endpoint, std::string topic,
                   const HttpLookupConfig& config, core::LookupClient::Callback callback)
        : resolver_(io)
        , stream_(io)
        , deadline_(io)
        , endpoint_(std::move(endpoint))
        , topic_(std::move(topic))
        , timeout_(config.timeout)
        , callback_(std::move(callback))
    {
        request_.version(11);
        request_.method(http::verb::get);
        request_.target(HttpLookupClient::lookupTarget(endpoint_, topic_));
        request_.set(http::field::host, endpoint_.host + ":" + endpoint_.port);
        request_.set(http::field::user_agent, config.user_agent);
        request_.set(http::field::accept, "application/vnd.nsq; version=1.0");
    }

    void start() {
        auto self = shared_from_this();
        deadline_.expires_after(timeout_);
        deadline_.async_wait([self](const beast::error_code& ec) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            self->timedOut_ = true;
            self->resolver_.cancel();
            self->stream_.cancel();
        });

        resolver_.async_resolve(endpoint_.host, endpoint_.port,
            [self](const beast::error_code& ec, tcp::resolver::results_type results) {
                self->onResolve(ec, results);
            });
    }

private:
    void onResolve(const beast::error_code& ec, const tcp::resolver::results_type& results) {
        if (ec) {
            fail("resolve", ec);
            return;
        }
        auto self = shared_from_this();
        stream_.async_connect(results,
            [self](const beast::error_code& ec, const tcp::endpoint&) {
                self->onConnect(ec);
            });
    }

    void onConnect(const beast::error_code& ec) {
        if (ec) {
            fail("connect", ec);
            return;
        }
        auto self = shared_from_this();
        http::async_write(stream_, request_,
            [self](const beast::error_code& ec, std::size_t) {
                self->onWrite(ec);
            });
    }

    void onWrite(const beast::error_code& ec) {
        if (ec) {
            fail("write", ec);
            return;
        }
        auto self = shared_from_this();
        http::async_read(stream_, buffer_, response_,
            [self](const beast::error_code& ec, std::size_t) {
                self->onRead(ec);
            });
    }

    void onRead(const beast::error_code& ec) {
        if (ec) {
            fail("read", ec);
            return;
        }
        deadline_.cancel();

        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);

        if (response_.result() != http::status::ok) {
            LOG_WARN("LookupClient", "Lookup of '{}' on {}:{} returned HTTP {}",
                     topic_, endpoint_.host, endpoint_.port, response_.result_int());
            callback_(false, {});
            return;
        }

        auto nodes = decodeLookupResponse(response_.body());
        if (!nodes) {
            LOG_WARN("LookupClient", "Lookup of '{}' on {}:{} returned an undecodable body",
                     topic_, endpoint_.host, endpoint_.port);
            callback_(false, {});
            return;
        }
        LOG_TRACE("LookupClient", "{}:{} has {} producer(s) for '{}'",
                  endpoint_.host, endpoint_.port, nodes->size(), topic_);
        callback_(true, *nodes);
    }

    void fail(const char* stage, const beast::error_code& ec) {
        deadline_.cancel();
        LOG_WARN("LookupClient", "Lookup of '{}' on {}:{} failed during {}: {}",
                 topic_, endpoint_.host, endpoint_.port, stage,
                 timedOut_ ? std::string("timed out") : ec.message());
        callback_(false, {});
    }

    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    asio::steady_timer deadline_;
    beast::flat_buffer buffer_;
    http::request<http::empty_body> request_;
    http::response<http::string_body> response_;
    HttpEndpoint endpoint_;
    std::string topic_;
    std::chrono::milliseconds timeout_;
    core::LookupClient::Callback callback_;
    bool timedOut_ = false;
};

std::string percentEncode(const std::string& value) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

}  // namespace

HttpLookupClient::HttpLookupClient(HttpLookupConfig config)
    : config_(std::move(config))
    , work_(asio::make_work_guard(io_))
{
    worker_ = std::thread([this]() { io_.run(); });
    LOG_DEBUG("LookupClient", "Created HTTP lookup client (timeout {}ms)",
              config_.timeout.count());
}

HttpLookupClient::~HttpLookupClient() {
    work_.reset();
    io_.stop();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::optional<HttpEndpoint> HttpLookupClient::parseEndpoint(const std::string& endpoint) {
    std::string rest = endpoint;

    auto scheme = rest.find("://");
    if (scheme != std::string::npos) {
        if (rest.compare(0, scheme, "http") != 0) {
            return std::nullopt;
        }
        rest = rest.substr(scheme + 3);
    }

    HttpEndpoint result;
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        result.basePath = rest.substr(slash);
        rest = rest.substr(0, slash);
        while (!result.basePath.empty() && result.basePath.back() == '/') {
            result.basePath.pop_back();
        }
    }

    std::string::size_type colon;
    if (!rest.empty() && rest.front() == '[') {
        auto close = rest.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        result.host = rest.substr(1, close - 1);
        colon = rest.find(':', close);
    } else {
        colon = rest.rfind(':');
        result.host = rest.substr(0, colon);
    }
    if (colon != std::string::npos) {
        std::string port = rest.substr(colon + 1);
        if (port.empty()) {
            return std::nullopt;
        }
        for (char c : port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
        }
        result.port = port;
    }

    if (result.host.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string HttpLookupClient::lookupTarget(const HttpEndpoint& endpoint, const std::string& topic) {
    return endpoint.basePath + "/lookup?topic=" + percentEncode(topic);
}

void HttpLookupClient::lookup(const std::string& endpoint, const std::string& topic,
                              Callback callback) {
    auto parsed = parseEndpoint(endpoint);
    if (!parsed) {
        LOG_WARN("LookupClient", "Invalid lookup endpoint '{}'", endpoint);
        callback(false, {});
        return;
    }

    auto exchange = std::make_shared<LookupExchange>(
        io_, std::move(*parsed), topic, config_, std::move(callback));
    asio::post(io_, [exchange]() { exchange->start(); });
}

}  // namespace lookup
}  // namespace nsqsub
