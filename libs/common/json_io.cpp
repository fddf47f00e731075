/**
 * @file json_io.cpp
 * @brief Decoding JSON text and files
 */

#include "wormscan/json_io.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <string>

namespace wormscan::common {

wormscan::Result<nlohmann::json> parse_json(std::string_view text, std::string_view label)
{
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            "ParseError", std::format("Failed to parse JSON from {}: {}", label, ex.what())));
    }
}

wormscan::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    const std::string text{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        return std::unexpected(
            Error::make("IOError", "Failed to read JSON file: " + path.string()));
    }
    return parse_json(text, "file " + path.string());
}

}  // namespace wormscan::common
