#pragma once

#include <boost/asio/ssl.hpp>

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace riglink::client {

// ============================================================================
// HTTP Errors
// ============================================================================

enum class HttpError {
    INVALID_URL,
    RESOLVE_FAILED,
    CONNECT_FAILED,
    TLS_FAILED,
    IO_ERROR,
    TIMEOUT,
};

std::string http_error_message(HttpError error);

// ============================================================================
// URL
// ============================================================================

struct HttpUrl {
    std::string host;
    std::string port;
    std::string target;   // path + query
    bool use_ssl = false;

    // http:// and https:// only
    static std::optional<HttpUrl> parse(std::string_view url);
};

struct HttpResponse {
    unsigned status = 0;
    std::string body;
};

// ============================================================================
// HTTP Client
// ============================================================================

// Blocking JSON POST. A response with any status is a success at this layer;
// the caller decides what the body means.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual std::expected<HttpResponse, HttpError> post_json(const std::string& url,
                                                             const std::string& body,
                                                             std::chrono::milliseconds timeout) = 0;
};

// Boost.Beast implementation. Each request runs on a private io_context
// bounded by the timeout; an expired request is cancelled and reported as
// TIMEOUT.
class BeastHttpClient : public HttpClient {
public:
    explicit BeastHttpClient(bool ssl_verify = true, const std::string& ca_file = {});

    std::expected<HttpResponse, HttpError> post_json(const std::string& url,
                                                     const std::string& body,
                                                     std::chrono::milliseconds timeout) override;

private:
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};
    bool ssl_verify_;
};

} // namespace riglink::client
