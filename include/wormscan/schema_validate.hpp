#pragma once

/**
 * @file schema_validate.hpp
 * @brief Draft-07 JSON Schema checks for documents wormscan writes
 */

#include "wormscan/common.hpp"

#include <cstddef>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace wormscan::common {

/// Violations spelled out in an error message; the rest are counted
constexpr std::size_t kMaxReportedViolations = 8;

/**
 * Check a document against the schema stored at schema_path.
 *
 * Errors:
 * - SchemaFileOpenFailed / SchemaParseFailed when the schema cannot be loaded
 * - SchemaBuildFailed when valijson rejects the schema itself
 * - SchemaValidationFailed with one "<pointer>: <description>" line per
 *   violation, at most kMaxReportedViolations of them
 */
[[nodiscard]] wormscan::VoidResult validate_json(const nlohmann::json& document,
                                                 const std::filesystem::path& schema_path);

}  // namespace wormscan::common
