#pragma once

/**
 * @file json_io.hpp
 * @brief Decoding JSON text and files into nlohmann::json
 */

#include "wormscan/common.hpp"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace wormscan::common {

/**
 * Decode JSON text.
 * @param text Raw JSON
 * @param label Source description used in the error message
 * @return Decoded value, or a ParseError "Failed to parse JSON from <label>: ..."
 */
[[nodiscard]] wormscan::Result<nlohmann::json> parse_json(std::string_view text,
                                                          std::string_view label);

/**
 * Read and decode a JSON file.
 * @return Decoded value, IOError when unreadable, ParseError when malformed
 */
[[nodiscard]] wormscan::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

}  // namespace wormscan::common
