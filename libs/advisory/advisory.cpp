/**
 * @file advisory.cpp
 * @brief Advisory feed normalization
 *
 * Dispatch is two rule tables:
 * - value rules look at a whole value (an array of records, a lone record,
 *   a keyed map)
 * - entry rules look at one (key, value) pair of a keyed map
 * All rules whose predicate holds are applied, in table order.
 */

#include "wormscan/advisory.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <numeric>
#include <optional>
#include <ranges>
#include <span>
#include <string_view>

namespace wormscan::advisory {

namespace {

/// Name-bearing record fields, in authority order
constexpr std::array<std::string_view, 6> kNameFields = {
    "name", "package", "package_name", "packageName", "pkg", "module"};

/// Record fields holding a sequence of versions
constexpr std::array<std::string_view, 3> kVersionListFields = {
    "versions", "affected_versions", "affected"};

constexpr std::string_view kVersionField = "version";
constexpr std::string_view kEcosystemField = "ecosystem";

/// Wrapper keys whose value is walked structurally instead of read as a package
constexpr std::array<std::string_view, 7> kContainerKeys = {
    "packages", "data", "items", "entries", "advisories", "malware", "results"};

constexpr int kMaxContainerDepth = 16;

struct Context
{
    const NormalizeOptions& options;
    AdvisoryMap& out;
    int depth;
};

[[nodiscard]] bool contains_key(std::span<const std::string_view> keys, std::string_view key)
{
    return std::ranges::find(keys, key) != keys.end();
}

[[nodiscard]] bool is_record_field(std::string_view key)
{
    return contains_key(kNameFields, key) || contains_key(kVersionListFields, key)
           || key == kVersionField || key == kEcosystemField;
}

[[nodiscard]] bool iequals(std::string_view a, std::string_view b)
{
    return std::ranges::equal(a, b, [](unsigned char lhs, unsigned char rhs) noexcept {
        return std::tolower(lhs) == std::tolower(rhs);
    });
}

void add_fact(Context& ctx, std::string_view name, std::string_view version)
{
    if (name.empty() || version.empty()) {
        return;
    }
    auto it = ctx.out.find(name);
    if (it == ctx.out.end()) {
        it = ctx.out.emplace(std::string(name), VersionSet{}).first;
    }
    it->second.emplace(version);
}

[[nodiscard]] bool is_version_array(const nlohmann::json& value)
{
    if (!value.is_array() || value.empty()) {
        return false;
    }
    return std::ranges::all_of(value, [](const nlohmann::json& item) {
        return item.is_string()
               && semver::looks_like_version(item.get_ref<const std::string&>());
    });
}

[[nodiscard]] bool is_version_string(const nlohmann::json& value)
{
    return value.is_string() && semver::looks_like_version(value.get_ref<const std::string&>());
}

[[nodiscard]] bool has_version_fields(const nlohmann::json& value)
{
    if (!value.is_object()) {
        return false;
    }
    if (value.contains(kVersionField)) {
        return true;
    }
    return std::ranges::any_of(kVersionListFields,
                               [&value](std::string_view key) { return value.contains(key); });
}

[[nodiscard]] bool has_name_field(const nlohmann::json& value)
{
    return std::ranges::any_of(kNameFields,
                               [&value](std::string_view key) { return value.contains(key); });
}

/**
 * Resolve a record's package name. The first name field present decides,
 * even when its value is unusable; without one the fallback applies.
 */
[[nodiscard]] std::optional<std::string> record_name(const nlohmann::json& record,
                                                     std::string_view fallback)
{
    for (const auto key : kNameFields) {
        const auto it = record.find(key);
        if (it == record.end()) {
            continue;
        }
        if (!it->is_string() || it->get_ref<const std::string&>().empty()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    }
    if (fallback.empty()) {
        return std::nullopt;
    }
    return std::string(fallback);
}

[[nodiscard]] bool ecosystem_matches(const nlohmann::json& record, const NormalizeOptions& options)
{
    const auto it = record.find(kEcosystemField);
    if (it == record.end() || !it->is_string()) {
        return true;
    }
    return iequals(it->get_ref<const std::string&>(), options.ecosystem);
}

void extract_record(const nlohmann::json& record, std::string_view fallback_name, Context& ctx)
{
    if (!record.is_object() || !ecosystem_matches(record, ctx.options)) {
        return;
    }
    const auto name = record_name(record, fallback_name);
    if (!name) {
        return;
    }
    if (const auto it = record.find(kVersionField); it != record.end() && it->is_string()) {
        add_fact(ctx, *name, it->get_ref<const std::string&>());
    }
    for (const auto key : kVersionListFields) {
        const auto it = record.find(key);
        if (it == record.end() || !it->is_array()) {
            continue;
        }
        for (const auto& version : *it) {
            if (version.is_string()) {
                add_fact(ctx, *name, version.get_ref<const std::string&>());
            }
        }
    }
}

void normalize_value(const nlohmann::json& value, Context& ctx);

// ============================================================================
// Entry rules: one (key, value) pair of a keyed map
// ============================================================================

struct EntryRule
{
    std::string_view name;
    bool (*matches)(std::string_view key, const nlohmann::json& value);
    void (*extract)(std::string_view key, const nlohmann::json& value, Context& ctx);
};

[[nodiscard]] bool is_container_key(std::string_view key)
{
    return contains_key(kContainerKeys, key);
}

/// A wrapper object's own name/version describe the feed, not a package
[[nodiscard]] bool has_container_key(const nlohmann::json& value)
{
    return std::ranges::any_of(kContainerKeys,
                               [&value](std::string_view key) { return value.contains(key); });
}

[[nodiscard]] bool is_package_key(std::string_view key)
{
    return !key.empty() && !is_record_field(key);
}

constexpr std::array<EntryRule, 5> kEntryRules = {
    {
     // { "packages": <anything> } -> walk the wrapped value
        {.name = "container",
         .matches = [](std::string_view key, const nlohmann::json& value) {
             return is_container_key(key)
                    && (value.is_object() || (value.is_array() && !is_version_array(value)));
         },
         .extract =
             [](std::string_view, const nlohmann::json& value, Context& ctx) {
                 if (ctx.depth >= kMaxContainerDepth) {
                     return;
                 }
                 Context inner{.options = ctx.options, .out = ctx.out, .depth = ctx.depth + 1};
                 normalize_value(value, inner);
             }},
     // { "evil": ["1.2.3", "1.2.4"] }
        {.name = "version-array",
         .matches = [](std::string_view key, const nlohmann::json& value) {
             return is_package_key(key) && is_version_array(value);
         },
         .extract =
             [](std::string_view key, const nlohmann::json& value, Context& ctx) {
                 for (const auto& version : value) {
                     add_fact(ctx, key, version.get_ref<const std::string&>());
                 }
             }},
     // { "evil": "1.2.3" }
        {.name = "version-string",
         .matches = [](std::string_view key, const nlohmann::json& value) {
             return is_package_key(key) && is_version_string(value);
         },
         .extract =
             [](std::string_view key, const nlohmann::json& value, Context& ctx) {
                 add_fact(ctx, key, value.get_ref<const std::string&>());
             }},
     // { "evil": { "versions": [...], "ecosystem": "npm" } }
        {.name = "keyed-record",
         .matches = [](std::string_view key, const nlohmann::json& value) {
             return is_package_key(key) && !is_container_key(key) && has_version_fields(value);
         },
         .extract = [](std::string_view key,
                       const nlohmann::json& value,
                       Context& ctx) { extract_record(value, key, ctx); }},
     // { "npm": { "evil": ["1.2.3"] } } -> one level deep
        {.name = "nested-scan",
         .matches = [](std::string_view key, const nlohmann::json& value) {
             return is_package_key(key) && !is_container_key(key) && value.is_object();
         },
         .extract =
             [](std::string_view, const nlohmann::json& value, Context& ctx) {
                 if (!ecosystem_matches(value, ctx.options)) {
                     return;
                 }
                 for (const auto& [inner_key, inner_value] : value.items()) {
                     if (!is_package_key(inner_key) || !is_version_array(inner_value)) {
                         continue;
                     }
                     for (const auto& version : inner_value) {
                         add_fact(ctx, inner_key, version.get_ref<const std::string&>());
                     }
                 }
             }},
     }
};

// ============================================================================
// Value rules: a whole decoded value
// ============================================================================

struct ValueRule
{
    std::string_view name;
    bool (*matches)(const nlohmann::json& value);
    void (*extract)(const nlohmann::json& value, Context& ctx);
};

constexpr std::array<ValueRule, 3> kValueRules = {
    {
     // [ { "name": ..., "version": ... }, ... ]
        {.name = "record-array",
         .matches = [](const nlohmann::json& value) { return value.is_array(); },
         .extract =
             [](const nlohmann::json& value, Context& ctx) {
                 for (const auto& entry : value) {
                     extract_record(entry, {}, ctx);
                 }
             }},
     // { "name": "evil", "versions": [...] }
        {.name = "record",
         .matches = [](const nlohmann::json& value) {
             return value.is_object() && has_name_field(value) && has_version_fields(value)
                    && !has_container_key(value);
         },
         .extract =
             [](const nlohmann::json& value, Context& ctx) { extract_record(value, {}, ctx); }},
     // { "evil": [...], "npm": {...}, "packages": {...} }
        {.name = "keyed-map",
         .matches = [](const nlohmann::json& value) { return value.is_object(); },
         .extract =
             [](const nlohmann::json& value, Context& ctx) {
                 if (!ecosystem_matches(value, ctx.options)) {
                     return;
                 }
                 for (const auto& [key, entry] : value.items()) {
                     for (const auto& rule : kEntryRules) {
                         if (rule.matches(key, entry)) {
                             rule.extract(key, entry, ctx);
                         }
                     }
                 }
             }},
     }
};

void normalize_value(const nlohmann::json& value, Context& ctx)
{
    for (const auto& rule : kValueRules) {
        if (rule.matches(value)) {
            rule.extract(value, ctx);
        }
    }
}

}  // namespace

AdvisoryMap normalize(const nlohmann::json& feed, const NormalizeOptions& options)
{
    AdvisoryMap map;
    Context ctx{.options = options, .out = map, .depth = 0};
    normalize_value(feed, ctx);
    return map;
}

std::size_t fact_count(const AdvisoryMap& map)
{
    return std::accumulate(map.begin(),
                           map.end(),
                           std::size_t{0},
                           [](std::size_t total, const auto& entry) {
                               return total + entry.second.size();
                           });
}

}  // namespace wormscan::advisory
