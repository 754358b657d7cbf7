#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "CopyQueue.h"

namespace decopy {

// Visible interior width of every box
constexpr std::size_t kBoxWidth = 51;

// Longest source name shown in the queue box
constexpr std::size_t kSourceNameLimit = 15;

namespace glyph {
constexpr const char* kVertical = "│";
constexpr const char* kHorizontal = "─";
constexpr const char* kSplitRight = "┤";
constexpr const char* kSplitLeft = "├";
constexpr const char* kSplitAbove = "┬";
constexpr const char* kSplitBelow = "┴";
constexpr const char* kTopLeft = "╭";
constexpr const char* kTopRight = "╮";
constexpr const char* kBottomLeft = "╰";
constexpr const char* kBottomRight = "╯";
constexpr const char* kArrowHead = ">";
} // namespace glyph

// SGR parameters for styled()
namespace sgr {
constexpr const char* kMagenta = "35";
constexpr const char* kRed = "31";
constexpr const char* kGreen = "32";
constexpr const char* kYellow = "33";
constexpr const char* kDarkGrey = "90";
constexpr const char* kDarkGreyBold = "1;90";
} // namespace sgr

/**
 * @brief Wraps text in an SGR sequence and a reset; returns text unchanged when disabled
 */
std::string styled(const std::string& text, const char* sgr_params, bool enabled = true);

/**
 * @brief Replaces the border glyph at a screen column (column 0 is the corner)
 */
struct Split {
    std::size_t column;
    std::string glyph;
};

/**
 * @brief Position of the T-junction between the source column and the destination column
 * @return min(visibleLength(source_name), 15) + 4
 */
std::size_t columnSplit(const std::string& source_name);

/**
 * @brief Row that gets the arrow from the source name
 * @return none for 0 destinations, 1 for 1 or 2, floor(count / 2) otherwise
 */
std::optional<std::size_t> arrowRow(std::size_t destination_count);

std::string topBorder(const std::optional<Split>& split = std::nullopt);
std::string bottomBorder(const std::optional<Split>& split = std::nullopt);

// ├───...───┤
std::string divider();

/**
 * @brief One interior row: "│ " + text + padding + "│"
 *
 * Padding is kBoxWidth - visibleLength(text) - 1 spaces, or none when the
 * text does not fit.
 */
std::string contentLine(const std::string& text);

/**
 * @brief Keeps the tail of text so it is at most max_chars wide, prefixed by "..."
 */
std::string elideFront(const std::string& text, std::size_t max_chars);

/**
 * @brief The two-column box linking the source name to its destinations
 *
 * @code
 * ╭────────┬──────────────────────────────────────────╮
 * │        │   /mnt/a                                 │
 * │  build ──> /mnt/b                                 │
 * │        │   /mnt/c                                 │
 * ╰────────┴──────────────────────────────────────────╯
 * @endcode
 *
 * One or two destinations put the arrow on the first row, more use arrowRow().
 *
 * @return Border and row strings, one per terminal line
 */
std::vector<std::string> queueBox(const CopyQueue& queue, bool color = true);

} // namespace decopy
