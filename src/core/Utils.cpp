#include "Utils.h"
#include <algorithm>
#include <cctype>

namespace decopy {

namespace {

constexpr char kEscape = '\033';
constexpr char kBell = '\007';

bool isContinuationByte(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

std::string formatBytes(std::uint64_t bytes)
{
    const char* units[] = {"b", "kb", "mb", "gb", "tb"};
    const int num_units = sizeof(units) / sizeof(units[0]);

    std::uint64_t value = bytes;
    int unit_index = 0;

    // Integer division at every step keeps the result truncated, never rounded
    while (value >= 1024 && unit_index < num_units - 1) {
        value /= 1024;
        ++unit_index;
    }

    return std::to_string(value) + units[unit_index];
}

std::string stripStyles(const std::string& str)
{
    std::string result;
    result.reserve(str.size());

    std::size_t i = 0;
    while (i < str.size()) {
        if (str[i] != kEscape) {
            result += str[i++];
            continue;
        }

        if (i + 1 >= str.size()) {
            break;  // lone trailing ESC
        }

        char kind = str[i + 1];
        i += 2;

        if (kind == '[') {
            // CSI: parameters and intermediates up to a final byte in @..~
            while (i < str.size()) {
                unsigned char c = static_cast<unsigned char>(str[i++]);
                if (c >= 0x40 && c <= 0x7E) {
                    break;
                }
            }
        } else if (kind == ']') {
            // OSC: terminated by BEL or ST (ESC backslash)
            while (i < str.size()) {
                if (str[i] == kBell) {
                    ++i;
                    break;
                }
                if (str[i] == kEscape && i + 1 < str.size() && str[i + 1] == '\\') {
                    i += 2;
                    break;
                }
                ++i;
            }
        }
    }

    return result;
}

std::size_t characterCount(const std::string& str)
{
    return static_cast<std::size_t>(
        std::count_if(str.begin(), str.end(), [](char c) { return !isContinuationByte(c); }));
}

std::size_t visibleLength(const std::string& str)
{
    return characterCount(stripStyles(str));
}

std::string truncate(const std::string& str, std::size_t max_chars)
{
    std::size_t seen = 0;
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (isContinuationByte(str[i])) {
            continue;
        }
        if (seen == max_chars) {
            return str.substr(0, i);
        }
        ++seen;
    }
    return str;
}

std::string trim(const std::string& str)
{
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char ch) { return std::isspace(ch); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string toLower(const std::string& str)
{
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

} // namespace decopy
