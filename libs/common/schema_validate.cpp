/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "wormscan/schema_validate.hpp"

#include "wormscan/json_io.hpp"

#include <exception>
#include <format>
#include <string>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace wormscan::common {

namespace {

[[nodiscard]] wormscan::Result<nlohmann::json> load_schema(const std::filesystem::path& path)
{
    auto schema = read_json_file(path);
    if (schema) {
        return schema;
    }
    if (schema.error().code == "IOError") {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + path.string()));
    }
    return std::unexpected(Error::make("SchemaParseFailed", schema.error().message));
}

[[nodiscard]] std::string describe_violations(valijson::ValidationResults& results)
{
    std::vector<std::string> lines;
    std::size_t omitted = 0;
    valijson::ValidationResults::Error violation;
    while (results.popError(violation)) {
        if (lines.size() == kMaxReportedViolations) {
            ++omitted;
            continue;
        }
        // valijson context is "<root>" followed by "[key]" / "[index]" parts
        std::string pointer;
        for (const auto& part : violation.context) {
            if (part == "<root>") {
                continue;
            }
            const bool bracketed = part.size() >= 2 && part.front() == '[' && part.back() == ']';
            pointer += "/" + (bracketed ? part.substr(1, part.size() - 2) : part);
        }
        lines.push_back(
            std::format("{}: {}", pointer.empty() ? "/" : pointer, violation.description));
    }

    std::string message;
    for (const auto& line : lines) {
        if (!message.empty()) {
            message += '\n';
        }
        message += line;
    }
    if (omitted != 0) {
        message += std::format("\n(+{} more)", omitted);
    }
    return message.empty() ? std::string("Schema validation failed.") : message;
}

}  // namespace

wormscan::VoidResult validate_json(const nlohmann::json& document,
                                   const std::filesystem::path& schema_path)
{
    auto schema_json = load_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    valijson::Schema schema;
    try {
        valijson::SchemaParser parser(valijson::SchemaParser::kDraft7);
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema);
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaBuildFailed",
            std::format("Failed to build schema {}: {}", schema_path.string(), ex.what())));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(document);
    if (!validator.validate(schema, target, &results)) {
        return std::unexpected(
            Error::make("SchemaValidationFailed", describe_violations(results)));
    }
    return {};
}

}  // namespace wormscan::common
