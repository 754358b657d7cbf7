#include "BoxLayout.h"
#include "Utils.h"
#include <algorithm>

namespace decopy {

namespace {

std::string horizontalRule(const char* left, const char* right, const std::optional<Split>& split)
{
    std::string line = left;
    for (std::size_t column = 1; column <= kBoxWidth; ++column) {
        if (split && split->column == column) {
            line += split->glyph;
        } else {
            line += glyph::kHorizontal;
        }
    }
    line += right;
    return line;
}

} // namespace

std::string styled(const std::string& text, const char* sgr_params, bool enabled)
{
    if (!enabled) {
        return text;
    }
    return std::string("\033[") + sgr_params + "m" + text + "\033[0m";
}

std::size_t columnSplit(const std::string& source_name)
{
    return std::min(visibleLength(source_name), kSourceNameLimit) + 4;
}

std::optional<std::size_t> arrowRow(std::size_t destination_count)
{
    switch (destination_count) {
        case 0:
            return std::nullopt;
        case 1:
        case 2:
            return 1;
        default:
            return destination_count / 2;
    }
}

std::string topBorder(const std::optional<Split>& split)
{
    return horizontalRule(glyph::kTopLeft, glyph::kTopRight, split);
}

std::string bottomBorder(const std::optional<Split>& split)
{
    return horizontalRule(glyph::kBottomLeft, glyph::kBottomRight, split);
}

std::string divider()
{
    return horizontalRule(glyph::kSplitLeft, glyph::kSplitRight, std::nullopt);
}

std::string contentLine(const std::string& text)
{
    std::size_t visible = visibleLength(text);
    std::size_t padding = visible < kBoxWidth ? kBoxWidth - visible - 1 : 0;

    return std::string(glyph::kVertical) + " " + text + std::string(padding, ' ') +
           glyph::kVertical;
}

std::string elideFront(const std::string& text, std::size_t max_chars)
{
    std::size_t count = characterCount(text);
    if (count <= max_chars) {
        return text;
    }
    if (max_chars <= 3) {
        return std::string(max_chars, '.');
    }

    // Skip code points until only max_chars - 3 remain
    std::size_t skip = count - (max_chars - 3);
    std::size_t i = 0;
    while (i < text.size()) {
        bool lead = (static_cast<unsigned char>(text[i]) & 0xC0) != 0x80;
        if (lead) {
            if (skip == 0) {
                break;
            }
            --skip;
        }
        ++i;
    }
    return "..." + text.substr(i);
}

std::vector<std::string> queueBox(const CopyQueue& queue, bool color)
{
    const std::string name = truncate(queue.sourceName(), kSourceNameLimit);
    const std::size_t split = columnSplit(name);
    const auto& destinations = queue.destinations();

    // One or two destinations point the arrow at the first row
    std::optional<std::size_t> arrow = arrowRow(destinations.size());
    if (arrow && destinations.size() <= 2) {
        arrow = 0;
    }

    std::vector<std::string> lines;
    lines.reserve(destinations.size() + 2);
    lines.push_back(topBorder(Split{split, glyph::kSplitAbove}));

    for (std::size_t row = 0; row < destinations.size(); ++row) {
        std::string destination = styled(destinations[row].string(), sgr::kDarkGrey, color);

        if (arrow && *arrow == row) {
            lines.push_back(contentLine(" " + name + " " + glyph::kHorizontal +
                                        glyph::kHorizontal + glyph::kArrowHead + " " +
                                        destination));
        } else {
            lines.push_back(contentLine(std::string(split - 2, ' ') + glyph::kVertical +
                                        "   " + destination));
        }
    }

    lines.push_back(bottomBorder(Split{split, glyph::kSplitBelow}));
    return lines;
}

} // namespace decopy
