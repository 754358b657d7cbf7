#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace decopy {

/**
 * @brief Formats byte count with binary units, truncating (e.g. 1536 -> "1kb")
 * @param bytes Number of bytes
 * @return Integer amount followed by b, kb, mb, gb or tb
 */
std::string formatBytes(std::uint64_t bytes);

/**
 * @brief Removes terminal escape sequences (CSI, OSC and two-byte ESC forms)
 * @param str String that may contain colour/style codes
 * @return The text a terminal would actually display
 */
std::string stripStyles(const std::string& str);

/**
 * @brief Counts UTF-8 code points (not bytes)
 */
std::size_t characterCount(const std::string& str);

/**
 * @brief Number of visibly rendered characters in a possibly styled string
 *
 * Equivalent to characterCount(stripStyles(str)). Use this for every width
 * calculation that touches colourised text.
 */
std::size_t visibleLength(const std::string& str);

/**
 * @brief Keeps at most max_chars code points
 */
std::string truncate(const std::string& str, std::size_t max_chars);

/**
 * @brief Trims whitespace from both ends of a string
 * @param str String to trim
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief ASCII lowercase copy of a string
 */
std::string toLower(const std::string& str);

} // namespace decopy
