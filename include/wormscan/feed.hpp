#pragma once

/**
 * @file feed.hpp
 * @brief Advisory feed retrieval (file or HTTP)
 */

#include "wormscan/common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace wormscan::feed {

constexpr const char* kDefaultDataUrl = "https://malware-list.aikido.dev/malware_predictions.json";

struct FetchOptions
{
    long connect_timeout_seconds = 15;
    long timeout_seconds = 120;
};

/**
 * @brief Process-wide libcurl initialization for the lifetime of the object
 *
 * Create one before any thread performs an HTTP fetch.
 */
class TransportSession
{
public:
    TransportSession();
    ~TransportSession();

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;
    TransportSession(TransportSession&&) = delete;
    TransportSession& operator=(TransportSession&&) = delete;

    [[nodiscard]] bool ok() const noexcept { return m_ok; }

private:
    bool m_ok;
};

/**
 * Map a `file://` URL or a plain path to a filesystem path.
 * @return std::nullopt for http(s) and other schemes
 */
[[nodiscard]] std::optional<std::filesystem::path> local_path_for(std::string_view url);

/**
 * Fetch and decode the advisory feed.
 *
 * `file://` URLs and plain paths are read from disk; `http://` and
 * `https://` go through libcurl. Failures are reported as FetchFailed:
 * "Failed to fetch malware data from <url>: <reason>".
 */
[[nodiscard]] wormscan::Result<nlohmann::json> fetch_advisory_feed(
    std::string_view url,
    const FetchOptions& options = {});

}  // namespace wormscan::feed
