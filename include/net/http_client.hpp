#pragma once

#include "util/result.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace mdeploy {

struct HttpTimeouts {
    std::chrono::seconds connect{10};
    std::chrono::seconds total{30};
};

inline constexpr HttpTimeouts kApiTimeouts{std::chrono::seconds{10}, std::chrono::seconds{30}};
inline constexpr HttpTimeouts kDownloadTimeouts{std::chrono::seconds{10}, std::chrono::seconds{120}};

enum class HttpMethod { Get, Head, Post };

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;
    std::string body;
    std::vector<std::string> headers;  // "Name: value"
    HttpTimeouts timeouts = kApiTimeouts;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool IsSuccess() const { return status >= 200 && status < 300; }
};

// A transport error (DNS, connect, timeout) is the unexpected branch; any
// HTTP status, including 4xx/5xx, is a response.
class IHttpClient {
  public:
    virtual ~IHttpClient() = default;

    virtual std::expected<HttpResponse, std::string> Send(const HttpRequest& req) = 0;

    // Streams the body to `dest_path` (through a ".part" file). Non-2xx fails.
    virtual Result Download(const std::string& url, const std::string& dest_path,
                            const HttpTimeouts& timeouts) = 0;

    std::expected<HttpResponse, std::string> Get(const std::string& url,
                                                 const HttpTimeouts& t = kApiTimeouts) {
        return Send(HttpRequest{.method = HttpMethod::Get, .url = url, .body = {}, .headers = {}, .timeouts = t});
    }
    std::expected<HttpResponse, std::string> Post(const std::string& url, std::string body,
                                                  const HttpTimeouts& t = kApiTimeouts) {
        return Send(HttpRequest{.method = HttpMethod::Post,
                                .url = url,
                                .body = std::move(body),
                                .headers = {"Content-Type: application/json"},
                                .timeouts = t});
    }
    std::expected<HttpResponse, std::string> Head(const std::string& url,
                                                  const HttpTimeouts& t = kApiTimeouts) {
        return Send(HttpRequest{.method = HttpMethod::Head, .url = url, .body = {}, .headers = {}, .timeouts = t});
    }
};

class CurlHttpClient final : public IHttpClient {
  public:
    CurlHttpClient();

    std::expected<HttpResponse, std::string> Send(const HttpRequest& req) override;
    Result Download(const std::string& url, const std::string& dest_path,
                    const HttpTimeouts& timeouts) override;
};

} // namespace mdeploy
