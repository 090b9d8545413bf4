#include "net/http_client.hpp"

#include "util/logger.hpp"

#include <curl/curl.h>

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>

namespace fs = std::filesystem;

namespace mdeploy {

namespace {

constexpr const char* kUserAgent = "motion-deploy/1.0";

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
struct FileDeleter {
    void operator()(std::FILE* f) const { std::fclose(f); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using CurlList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t WriteToString(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

size_t WriteToFile(void* contents, size_t size, size_t nmemb, void* userp) {
    return std::fwrite(contents, size, nmemb, static_cast<std::FILE*>(userp)) * size;
}

void ApplyCommon(CURL* c, const std::string& url, const HttpTimeouts& t) {
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(c, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, static_cast<long>(t.connect.count()));
    curl_easy_setopt(c, CURLOPT_TIMEOUT, static_cast<long>(t.total.count()));
}

} // namespace

CurlHttpClient::CurlHttpClient() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::expected<HttpResponse, std::string> CurlHttpClient::Send(const HttpRequest& req) {
    CurlHandle curl(curl_easy_init());
    if (!curl) return std::unexpected("failed to initialize cURL");

    HttpResponse resp;
    ApplyCommon(curl.get(), req.url, req.timeouts);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteToString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);

    CurlList headers;
    for (const auto& h : req.headers) {
        curl_slist* next = curl_slist_append(headers.get(), h.c_str());
        if (!next) return std::unexpected("failed to build request headers");
        (void)headers.release();
        headers.reset(next);
    }
    if (headers) curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    switch (req.method) {
        case HttpMethod::Get:
            break;
        case HttpMethod::Head:
            curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
            break;
        case HttpMethod::Post:
            curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, req.body.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
            break;
    }

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        return std::unexpected(req.url + ": " + curl_easy_strerror(rc));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
    LogDebug("HTTP %s -> %ld (%zu bytes)", req.url.c_str(), resp.status, resp.body.size());
    return resp;
}

Result CurlHttpClient::Download(const std::string& url, const std::string& dest_path,
                                const HttpTimeouts& timeouts) {
    CurlHandle curl(curl_easy_init());
    if (!curl) return Result::Fail(-1, "failed to initialize cURL");

    const std::string part = dest_path + ".part";
    std::unique_ptr<std::FILE, FileDeleter> out(std::fopen(part.c_str(), "wb"));
    if (!out) return Result::Fail(errno, "cannot create " + part);

    ApplyCommon(curl.get(), url, timeouts);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteToFile);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, out.get());

    const CURLcode rc = curl_easy_perform(curl.get());
    const bool flushed = std::fflush(out.get()) == 0;
    out.reset();

    std::error_code ec;
    if (rc != CURLE_OK || !flushed) {
        fs::remove(part, ec);
        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        std::string why = rc != CURLE_OK ? curl_easy_strerror(rc) : "write failed";
        if (status >= 400) why += " (HTTP " + std::to_string(status) + ")";
        return Result::Fail(-1, "download of " + url + " failed: " + why);
    }

    fs::rename(part, dest_path, ec);
    if (ec) {
        fs::remove(part, ec);
        return Result::Fail(-1, "cannot move download into place: " + dest_path);
    }
    return Result::Ok();
}

} // namespace mdeploy
