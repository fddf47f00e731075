/**
 * @file semver.cpp
 * @brief Version parsing and ordering
 */

#include "wormscan/semver.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <system_error>

namespace wormscan::semver {

namespace {

[[nodiscard]] bool is_digit(char c) noexcept
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] std::string_view trim(std::string_view input)
{
    std::size_t start = 0;
    while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start])) != 0) {
        ++start;
    }
    std::size_t end = input.size();
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
        --end;
    }
    return input.substr(start, end - start);
}

[[nodiscard]] std::optional<std::uint64_t> parse_number(std::string_view segment)
{
    if (segment.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const char* begin = segment.data();
    const char* end = segment.data() + segment.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::optional<ParsedVersion> parse(std::string_view input)
{
    std::string_view text = trim(input);
    if (text.starts_with('v')) {
        text.remove_prefix(1);
    }

    std::array<std::string_view, 3> segments{};
    std::size_t count = 0;
    std::size_t pos = 0;
    while (count < segments.size()) {
        const auto dot = text.find('.', pos);
        if (dot == std::string_view::npos) {
            segments[count++] = text.substr(pos);
            break;
        }
        segments[count++] = text.substr(pos, dot - pos);
        pos = dot + 1;
    }
    if (count < segments.size()) {
        return std::nullopt;
    }

    std::string_view patch = segments[2];
    if (const auto cut = patch.find('-'); cut != std::string_view::npos) {
        patch = patch.substr(0, cut);
    }

    auto major = parse_number(segments[0]);
    auto minor = parse_number(segments[1]);
    auto patch_value = parse_number(patch);
    if (!major || !minor || !patch_value) {
        return std::nullopt;
    }
    return ParsedVersion{.major = *major, .minor = *minor, .patch = *patch_value};
}

std::strong_ordering compare(std::string_view a, std::string_view b)
{
    const auto pa = parse(a);
    const auto pb = parse(b);
    if (pa && pb) {
        return *pa <=> *pb;
    }
    if (pa) {
        return std::strong_ordering::less;
    }
    if (pb) {
        return std::strong_ordering::greater;
    }
    return a <=> b;
}

bool looks_like_version(std::string_view input)
{
    // digits '.' digits anywhere in the string
    std::size_t i = 0;
    while (i < input.size()) {
        if (!is_digit(input[i])) {
            ++i;
            continue;
        }
        std::size_t j = i;
        while (j < input.size() && is_digit(input[j])) {
            ++j;
        }
        if (j + 1 < input.size() && input[j] == '.' && is_digit(input[j + 1])) {
            return true;
        }
        i = j;
    }
    return false;
}

}  // namespace wormscan::semver
