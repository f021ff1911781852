#include "text_width.hpp"

#include <algorithm>
#include <iterator>

namespace sc::chat::text
{
namespace
{

struct Interval
{
    std::uint32_t first;
    std::uint32_t last;
};

constexpr Interval kZeroWidth[] = {
    {0x0300, 0x036F}, {0x0483, 0x0489}, {0x0591, 0x05BD}, {0x0610, 0x061A}, {0x064B, 0x065F},
    {0x0E31, 0x0E31}, {0x0E34, 0x0E3A}, {0x0E47, 0x0E4E}, {0x1AB0, 0x1AFF}, {0x1DC0, 0x1DFF},
    {0x200B, 0x200F}, {0x202A, 0x202E}, {0x2060, 0x2064}, {0x20D0, 0x20F0}, {0xFE00, 0xFE0F},
    {0xFE20, 0xFE2F}, {0xFEFF, 0xFEFF}, {0x1F3FB, 0x1F3FF}, {0xE0100, 0xE01EF}};

constexpr Interval kDoubleWidth[] = {
    {0x1100, 0x115F}, {0x231A, 0x231B}, {0x2329, 0x232A}, {0x23E9, 0x23EC}, {0x23F0, 0x23F0},
    {0x23F3, 0x23F3}, {0x25FD, 0x25FE}, {0x2614, 0x2615}, {0x2648, 0x2653}, {0x267F, 0x267F},
    {0x2693, 0x2693}, {0x26A1, 0x26A1}, {0x26AA, 0x26AB}, {0x26BD, 0x26BE}, {0x26C4, 0x26C5},
    {0x26CE, 0x26CE}, {0x26D4, 0x26D4}, {0x26EA, 0x26EA}, {0x26F2, 0x26F3}, {0x26F5, 0x26F5},
    {0x26FA, 0x26FA}, {0x26FD, 0x26FD}, {0x2705, 0x2705}, {0x270A, 0x270B}, {0x2728, 0x2728},
    {0x274C, 0x274C}, {0x274E, 0x274E}, {0x2753, 0x2755}, {0x2757, 0x2757}, {0x2795, 0x2797},
    {0x27B0, 0x27B0}, {0x27BF, 0x27BF}, {0x2B1B, 0x2B1C}, {0x2B50, 0x2B50}, {0x2B55, 0x2B55},
    {0x2E80, 0x303E}, {0x3040, 0x3247}, {0x3250, 0x4DBF}, {0x4E00, 0xA4C6}, {0xA960, 0xA97C},
    {0xAC00, 0xD7A3}, {0xF900, 0xFAFF}, {0xFE10, 0xFE19}, {0xFE30, 0xFE6B}, {0xFF01, 0xFF60},
    {0xFFE0, 0xFFE6}, {0x1F004, 0x1F004}, {0x1F0CF, 0x1F0CF}, {0x1F18E, 0x1F18E}, {0x1F191, 0x1F19A},
    {0x1F200, 0x1F251}, {0x1F300, 0x1F64F}, {0x1F680, 0x1F6FF}, {0x1F7E0, 0x1F7EB}, {0x1F90C, 0x1F9FF},
    {0x1FA70, 0x1FAFF}, {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD}};

template <std::size_t N>
bool inTable(std::uint32_t codepoint, const Interval (&table)[N])
{
    if (codepoint < table[0].first || codepoint > table[N - 1].last)
        return false;
    auto it = std::lower_bound(std::begin(table), std::end(table), codepoint,
                               [](const Interval &interval, std::uint32_t cp) { return interval.last < cp; });
    return it != std::end(table) && codepoint >= it->first;
}

struct Glyph
{
    std::size_t start = 0;
    std::size_t end = 0;
    int width = 0;
};

std::vector<Glyph> glyphsOf(std::string_view text)
{
    std::vector<Glyph> glyphs;
    std::size_t index = 0;
    while (index < text.size())
    {
        Glyph glyph;
        glyph.start = index;
        glyph.width = codepointWidth(nextCodepoint(text, index));
        glyph.end = index;
        // Combining marks stay with the glyph they modify.
        if (glyph.width == 0 && !glyphs.empty())
            glyphs.back().end = glyph.end;
        else
            glyphs.push_back(glyph);
    }
    return glyphs;
}

class RowBuilder
{
public:
    explicit RowBuilder(int columns) : columns_(columns) {}

    void addWord(std::string_view word)
    {
        int width = displayWidth(word);
        if (used_ > 0 && used_ + 1 + width <= columns_)
        {
            current_.push_back(' ');
            current_.append(word);
            used_ += 1 + width;
            return;
        }
        if (used_ > 0)
            breakRow();
        if (width <= columns_)
        {
            current_.assign(word);
            used_ = width;
            return;
        }
        for (const Glyph &glyph : glyphsOf(word))
        {
            if (used_ > 0 && used_ + glyph.width > columns_)
                breakRow();
            current_.append(word.substr(glyph.start, glyph.end - glyph.start));
            used_ += glyph.width;
        }
    }

    void breakRow()
    {
        rows_.push_back(std::move(current_));
        current_.clear();
        used_ = 0;
    }

    std::vector<std::string> finish()
    {
        breakRow();
        return std::move(rows_);
    }

private:
    int columns_;
    int used_ = 0;
    std::string current_;
    std::vector<std::string> rows_;
};

} // namespace

std::uint32_t nextCodepoint(std::string_view text, std::size_t &index)
{
    if (index >= text.size())
        return 0;
    auto byteAt = [&](std::size_t offset) { return static_cast<unsigned char>(text[index + offset]); };
    auto continuation = [&](std::size_t offset) { return (byteAt(offset) & 0xC0) == 0x80; };

    unsigned char lead = byteAt(0);
    std::size_t remaining = text.size() - index;
    if (lead < 0x80)
    {
        ++index;
        return lead;
    }
    if ((lead & 0xE0) == 0xC0 && remaining >= 2 && continuation(1))
    {
        std::uint32_t cp = ((lead & 0x1Fu) << 6) | (byteAt(1) & 0x3Fu);
        index += 2;
        return cp;
    }
    if ((lead & 0xF0) == 0xE0 && remaining >= 3 && continuation(1) && continuation(2))
    {
        std::uint32_t cp = ((lead & 0x0Fu) << 12) | ((byteAt(1) & 0x3Fu) << 6) | (byteAt(2) & 0x3Fu);
        index += 3;
        return cp;
    }
    if ((lead & 0xF8) == 0xF0 && remaining >= 4 && continuation(1) && continuation(2) && continuation(3))
    {
        std::uint32_t cp = ((lead & 0x07u) << 18) | ((byteAt(1) & 0x3Fu) << 12) | ((byteAt(2) & 0x3Fu) << 6) |
                           (byteAt(3) & 0x3Fu);
        index += 4;
        return cp;
    }
    ++index;
    return lead;
}

int codepointWidth(std::uint32_t codepoint)
{
    if (codepoint < 0x20 || (codepoint >= 0x7F && codepoint < 0xA0))
        return 0;
    if (inTable(codepoint, kZeroWidth))
        return 0;
    if (inTable(codepoint, kDoubleWidth))
        return 2;
    return 1;
}

int displayWidth(std::string_view text)
{
    int width = 0;
    std::size_t index = 0;
    while (index < text.size())
        width += codepointWidth(nextCodepoint(text, index));
    return width;
}

std::vector<std::string> wrap(std::string_view text, int columns)
{
    RowBuilder builder(std::max(1, columns));
    std::size_t lineStart = 0;
    while (true)
    {
        std::size_t lineEnd = text.find('\n', lineStart);
        std::string_view line = text.substr(lineStart, lineEnd == std::string_view::npos ? std::string_view::npos
                                                                                          : lineEnd - lineStart);
        std::size_t pos = 0;
        while (pos < line.size())
        {
            std::size_t wordStart = line.find_first_not_of(" \t\r", pos);
            if (wordStart == std::string_view::npos)
                break;
            std::size_t wordEnd = line.find_first_of(" \t\r", wordStart);
            if (wordEnd == std::string_view::npos)
                wordEnd = line.size();
            builder.addWord(line.substr(wordStart, wordEnd - wordStart));
            pos = wordEnd;
        }
        if (lineEnd == std::string_view::npos)
            break;
        builder.breakRow();
        lineStart = lineEnd + 1;
    }
    return builder.finish();
}

} // namespace sc::chat::text
