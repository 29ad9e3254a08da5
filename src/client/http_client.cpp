#include "client/http_client.hpp"
#include "common/logger.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/url.hpp>

#include <exception>
#include <type_traits>

namespace riglink::client {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {
auto& log() { return Logger::get("client.http"); }

enum class Stage { RESOLVE, CONNECT, TLS, EXCHANGE };

// Progress of one request, shared between the coroutine and the driver
struct Exchange {
    Stage stage = Stage::RESOLVE;
    bool done = false;
    bool failed = false;
    bool timed_out = false;
    std::string failure;
    HttpResponse response;
};

http::request<http::string_body> make_request(const HttpUrl& url, const std::string& body) {
    http::request<http::string_body> req{http::verb::post, url.target, 11};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, "RigLink/1.0");
    req.set(http::field::content_type, "application/json");
    req.set(http::field::accept, "application/json");
    req.body() = body;
    req.prepare_payload();
    return req;
}

template<typename Stream>
net::awaitable<void> run_exchange(tcp::resolver& resolver, Stream& stream, const HttpUrl& url,
                                  http::request<http::string_body>& req, Exchange& ex) {
    ex.stage = Stage::RESOLVE;
    auto endpoints = co_await resolver.async_resolve(url.host, url.port, net::use_awaitable);

    ex.stage = Stage::CONNECT;
    co_await beast::get_lowest_layer(stream).async_connect(endpoints, net::use_awaitable);

    if constexpr (!std::is_same_v<Stream, beast::tcp_stream>) {
        ex.stage = Stage::TLS;
        co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
    }

    ex.stage = Stage::EXCHANGE;
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res, net::use_awaitable);

    ex.response.status = res.result_int();
    ex.response.body = std::move(res.body());
}

auto on_complete(Exchange& ex) {
    return [&ex](std::exception_ptr ep) {
        ex.done = true;
        if (!ep) {
            return;
        }
        ex.failed = true;
        try {
            std::rethrow_exception(ep);
        } catch (const boost::system::system_error& e) {
            ex.failure = e.code().message();
        } catch (const std::exception& e) {
            ex.failure = e.what();
        }
    };
}

// Run the io_context until the exchange finishes or the deadline passes.
// On expiry the socket is closed and the cancelled coroutine is drained.
void drive(net::io_context& ioc, tcp::resolver& resolver, beast::tcp_stream& lowest,
           Exchange& ex, std::chrono::milliseconds timeout) {
    ioc.run_for(timeout);
    if (!ex.done) {
        ex.timed_out = true;
        resolver.cancel();
        lowest.close();
        ioc.restart();
        ioc.run();
    }
}

std::expected<HttpResponse, HttpError> to_result(const std::string& url, Exchange& ex) {
    if (ex.timed_out) {
        log().warn("POST {} timed out", url);
        return std::unexpected(HttpError::TIMEOUT);
    }
    if (ex.failed) {
        log().warn("POST {} failed: {}", url, ex.failure);
        switch (ex.stage) {
            case Stage::RESOLVE: return std::unexpected(HttpError::RESOLVE_FAILED);
            case Stage::CONNECT: return std::unexpected(HttpError::CONNECT_FAILED);
            case Stage::TLS: return std::unexpected(HttpError::TLS_FAILED);
            case Stage::EXCHANGE: break;
        }
        return std::unexpected(HttpError::IO_ERROR);
    }
    log().debug("POST {} -> {}", url, ex.response.status);
    return std::move(ex.response);
}

} // anonymous namespace

std::string http_error_message(HttpError error) {
    switch (error) {
        case HttpError::INVALID_URL: return "Invalid URL";
        case HttpError::RESOLVE_FAILED: return "DNS resolution failed";
        case HttpError::CONNECT_FAILED: return "Connection failed";
        case HttpError::TLS_FAILED: return "TLS handshake failed";
        case HttpError::IO_ERROR: return "Request failed";
        case HttpError::TIMEOUT: return "Request timed out";
        default: return "Unknown HTTP error";
    }
}

std::optional<HttpUrl> HttpUrl::parse(std::string_view url) {
    auto parsed = boost::urls::parse_uri(url);
    if (!parsed) {
        return std::nullopt;
    }

    HttpUrl result;
    if (parsed->scheme() == "https") {
        result.use_ssl = true;
    } else if (parsed->scheme() != "http") {
        return std::nullopt;
    }

    result.host = parsed->host();
    if (result.host.empty()) {
        return std::nullopt;
    }
    result.port = parsed->has_port() ? std::string(parsed->port()) : (result.use_ssl ? "443" : "80");
    result.target = std::string(parsed->encoded_target());
    if (result.target.empty()) {
        result.target = "/";
    }
    return result;
}

BeastHttpClient::BeastHttpClient(bool ssl_verify, const std::string& ca_file)
    : ssl_verify_(ssl_verify) {
    boost::system::error_code ec;
    if (ca_file.empty()) {
        ssl_ctx_.set_default_verify_paths(ec);
    } else {
        ssl_ctx_.load_verify_file(ca_file, ec);
    }
    if (ec) {
        log().warn("Failed to load CA certificates: {}", ec.message());
    }
    ssl_ctx_.set_verify_mode(ssl_verify ? ssl::verify_peer : ssl::verify_none);
}

std::expected<HttpResponse, HttpError> BeastHttpClient::post_json(const std::string& url,
                                                                  const std::string& body,
                                                                  std::chrono::milliseconds timeout) {
    auto parts = HttpUrl::parse(url);
    if (!parts) {
        log().error("Invalid URL: {}", url);
        return std::unexpected(HttpError::INVALID_URL);
    }

    auto req = make_request(*parts, body);
    Exchange ex;
    net::io_context ioc;
    tcp::resolver resolver(ioc);

    if (parts->use_ssl) {
        beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx_);

        // Set SNI hostname
        if (!SSL_set_tlsext_host_name(stream.native_handle(), parts->host.c_str())) {
            log().error("Failed to set SNI hostname for {}", parts->host);
            return std::unexpected(HttpError::TLS_FAILED);
        }
        if (ssl_verify_) {
            stream.set_verify_callback(ssl::host_name_verification(parts->host));
        }

        net::co_spawn(ioc, run_exchange(resolver, stream, *parts, req, ex), on_complete(ex));
        drive(ioc, resolver, beast::get_lowest_layer(stream), ex, timeout);
        return to_result(url, ex);
    }

    beast::tcp_stream stream(ioc);
    net::co_spawn(ioc, run_exchange(resolver, stream, *parts, req, ex), on_complete(ex));
    drive(ioc, resolver, stream, ex, timeout);
    return to_result(url, ex);
}

} // namespace riglink::client
