#pragma once

/**
 * @file version.hpp
 * @brief wormscan version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace wormscan {

/// wormscan version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Report format version (embedded in JSON output)
constexpr const char* kReportSchemaVersion = "scan_report.v1";

}  // namespace wormscan
