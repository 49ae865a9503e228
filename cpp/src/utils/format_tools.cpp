#include "utils/format_tools.hpp"

#include <fmt/chrono.h>

namespace relayhub::format_tools
{

// Formatted local time with sub-second resolution. The fraction is computed
// separately so the output does not depend on fmt's chrono subsecond support.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(secs)));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string iso8601_utc(std::chrono::system_clock::time_point timestamp)
{
    auto tp_ms = std::chrono::time_point_cast<std::chrono::milliseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_ms);
    int ms = static_cast<int>((tp_ms - secs).count() % 1000);
    if (ms < 0)
        ms += 1000;
    auto sec_part = fmt::format("{:%Y-%m-%dT%H:%M:%S}", fmt::gmtime(std::chrono::system_clock::to_time_t(secs)));
    return fmt::format("{}.{:03d}Z", sec_part, ms);
}

std::string_view trim_whitespace(std::string_view sv) noexcept
{
    constexpr std::string_view kWhitespace = " \t\n\r\f\v";
    const auto first = sv.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = sv.find_last_not_of(kWhitespace);
    return sv.substr(first, last - first + 1);
}

std::optional<std::string> extract_value_from_string(std::string_view keyword,
                                                     std::string_view input, char separator,
                                                     char assignment_symbol)
{
    std::string_view::size_type start = 0;
    while (start < input.size())
    {
        // Find the next separator or the end of the string
        std::string_view::size_type end = input.find(separator, start);
        if (end == std::string_view::npos)
        {
            end = input.size();
        }

        std::string_view segment = input.substr(start, end - start);
        start = end + 1;

        std::string_view::size_type assignment_pos = segment.find(assignment_symbol);
        if (assignment_pos == std::string_view::npos)
        {
            continue; // No assignment symbol, so it's not a valid pair
        }

        std::string_view key_sv = trim_whitespace(segment.substr(0, assignment_pos));
        if (key_sv == keyword)
        {
            return std::string(trim_whitespace(segment.substr(assignment_pos + 1)));
        }
    }
    return std::nullopt;
}

} // namespace relayhub::format_tools
