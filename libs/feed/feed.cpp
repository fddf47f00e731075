/**
 * @file feed.cpp
 * @brief Advisory feed retrieval over file:// and HTTP(S)
 */

#include "wormscan/feed.hpp"

#include "wormscan/json_io.hpp"
#include "wormscan/version.hpp"

#include <array>
#include <format>
#include <memory>
#include <new>
#include <string>

#include <curl/curl.h>

namespace wormscan::feed {

namespace {

constexpr std::string_view kFileScheme = "file://";

struct CurlDeleter
{
    void operator()(CURL* curl) const noexcept
    {
        if (curl != nullptr) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

std::size_t append_body(char* data, std::size_t size, std::size_t nmemb, void* userdata)
{
    auto* body = static_cast<std::string*>(userdata);
    const std::size_t bytes = size * nmemb;
    body->append(data, bytes);
    return bytes;
}

struct CurlFree
{
    void operator()(char* text) const noexcept { curl_free(text); }
};

/// libcurl's URL decoder; invalid escapes pass through untouched
[[nodiscard]] std::string url_decode(std::string_view text)
{
    int decoded_length = 0;
    const std::unique_ptr<char, CurlFree> decoded(curl_easy_unescape(
        nullptr, text.data(), static_cast<int>(text.size()), &decoded_length));
    if (!decoded) {
        throw std::bad_alloc();
    }
    return {decoded.get(), static_cast<std::size_t>(decoded_length)};
}

[[nodiscard]] bool is_http_url(std::string_view url)
{
    return url.starts_with("http://") || url.starts_with("https://");
}

[[nodiscard]] wormscan::Result<std::string> http_get(const std::string& url,
                                                     const FetchOptions& options)
{
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return std::unexpected(Error::make("FetchFailed", "curl_easy_init failed"));
    }

    std::string body;
    std::array<char, CURL_ERROR_SIZE> error_buffer{};
    const std::string user_agent = std::format("wormscan/{}", kVersion);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer.data());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options.connect_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options.timeout_seconds);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_HTTP_RETURNED_ERROR) {
        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        return std::unexpected(Error::make("FetchFailed", std::format("HTTP {}", status)));
    }
    if (res != CURLE_OK) {
        const std::string detail =
            error_buffer[0] != '\0' ? std::string(error_buffer.data()) : curl_easy_strerror(res);
        return std::unexpected(Error::make("FetchFailed", detail));
    }
    return body;
}

[[nodiscard]] wormscan::Result<nlohmann::json> load(std::string_view url,
                                                    const FetchOptions& options)
{
    if (auto path = local_path_for(url)) {
        return common::read_json_file(*path);
    }
    if (!is_http_url(url)) {
        return std::unexpected(
            Error::make("FetchFailed", std::format("Unsupported URL scheme: {}", url)));
    }
    auto body = http_get(std::string(url), options);
    if (!body) {
        return std::unexpected(body.error());
    }
    return common::parse_json(*body, "malware list");
}

}  // namespace

TransportSession::TransportSession()
    : m_ok(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK)
{}

TransportSession::~TransportSession()
{
    if (m_ok) {
        curl_global_cleanup();
    }
}

std::optional<std::filesystem::path> local_path_for(std::string_view url)
{
    if (url.starts_with(kFileScheme)) {
        std::string_view rest = url.substr(kFileScheme.size());
        if (rest.starts_with("localhost/")) {
            rest.remove_prefix(std::string_view("localhost").size());
        }
        return std::filesystem::path(url_decode(rest));
    }
    if (url.find("://") != std::string_view::npos) {
        return std::nullopt;
    }
    return std::filesystem::path(url);
}

wormscan::Result<nlohmann::json> fetch_advisory_feed(std::string_view url,
                                                     const FetchOptions& options)
{
    auto feed = load(url, options);
    if (!feed) {
        return std::unexpected(Error::make(
            "FetchFailed",
            std::format("Failed to fetch malware data from {}: {}", url, feed.error().message)));
    }
    return feed;
}

}  // namespace wormscan::feed
