#include <gtest/gtest.h>

#include "chat_line_item.hpp"
#include "text_width.hpp"

#include "sc/scroll/scroll_viewport.hpp"

#include <memory>
#include <string>
#include <vector>

using sc::chat::ChatLine;
using sc::chat::ChatLineItem;
using sc::chat::WrapState;
namespace text = sc::chat::text;

namespace
{

ChatLine makeLine(sc::chat::MessageId id, const std::string &user, const std::string &body)
{
    ChatLine line;
    line.id = id;
    line.user = user;
    line.text = body;
    return line;
}

} // namespace

TEST(TextWidth, MeasuresUtf8Glyphs)
{
    EXPECT_EQ(text::displayWidth("abc"), 3);
    EXPECT_EQ(text::displayWidth("caf\xC3\xA9"), 4);
    EXPECT_EQ(text::displayWidth("e\xCC\x81"), 1);
    EXPECT_EQ(text::displayWidth("\xE4\xBD\xA0\xE5\xA5\xBD"), 4);
    EXPECT_EQ(text::displayWidth("\xF0\x9F\x98\x80"), 2);

    std::size_t index = 0;
    EXPECT_EQ(text::nextCodepoint("\xFF" "a", index), 0xFFu);
    EXPECT_EQ(index, 1u);
}

TEST(TextWidth, WrapsOnWordBoundaries)
{
    std::vector<std::string> expected{"the quick", "brown fox", "jumps"};
    EXPECT_EQ(text::wrap("the quick brown fox jumps", 10), expected);
}

TEST(TextWidth, BreaksLongWordsAndKeepsNewlines)
{
    std::vector<std::string> broken{"abcd", "efgh", "ij"};
    EXPECT_EQ(text::wrap("abcdefghij", 4), broken);

    std::vector<std::string> lines{"one", "", "two"};
    EXPECT_EQ(text::wrap("one\n\ntwo", 20), lines);

    EXPECT_EQ(text::wrap("", 5), std::vector<std::string>{""});
}

TEST(TextWidth, WideGlyphsAreNotSplit)
{
    std::vector<std::string> rows = text::wrap("\xE4\xBD\xA0\xE5\xA5\xBD\xE5\x90\x97", 3);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], "\xE4\xBD\xA0");
    EXPECT_EQ(text::displayWidth(rows[2]), 2);
}

TEST(ChatLineItem, HeightFollowsWrappedRows)
{
    ChatLineItem item(makeLine(1, "bob", "hello there general kenobi"));
    auto state = item.createState();

    sc::scroll::Size wide = item.layout(*state, sc::scroll::itemLimits({80.0f, 10.0f}));
    EXPECT_FLOAT_EQ(wide.height, 1.0f);
    EXPECT_FLOAT_EQ(wide.width, 31.0f);

    sc::scroll::Size narrow = item.layout(*state, sc::scroll::itemLimits({12.0f, 10.0f}));
    const WrapState &wrap = ChatLineItem::wrapState(*state);
    std::vector<std::string> expected{"bob: hello", "there", "general", "kenobi"};
    EXPECT_EQ(wrap.rows, expected);
    EXPECT_FLOAT_EQ(narrow.height, 4.0f);
    EXPECT_EQ(wrap.prefixColumns, 5);
}

TEST(ChatLineItem, WrapStateMarksLocalLines)
{
    ChatLine sent = makeLine(2, "me", "hi");
    sent.local = true;
    ChatLineItem mine(sent);
    auto mineState = mine.createState();
    EXPECT_TRUE(ChatLineItem::wrapState(*mineState).local);

    ChatLineItem theirs(makeLine(3, "bob", "hi"));
    auto theirState = theirs.createState();
    EXPECT_FALSE(ChatLineItem::wrapState(*theirState).local);

    mine.syncState(*theirState);
    EXPECT_TRUE(ChatLineItem::wrapState(*theirState).local);
}

TEST(ChatLineItem, RewrapsOnlyWhenWidthOrTextChanges)
{
    ChatLineItem item(makeLine(7, "amy", "short"));
    auto state = item.createState();
    item.layout(*state, sc::scroll::itemLimits({40.0f, 5.0f}));
    item.layout(*state, sc::scroll::itemLimits({40.0f, 5.0f}));
    EXPECT_EQ(ChatLineItem::wrapState(*state).wraps, 1);

    item.syncState(*state);
    item.layout(*state, sc::scroll::itemLimits({40.0f, 5.0f}));
    EXPECT_EQ(ChatLineItem::wrapState(*state).wraps, 1);

    ChatLineItem edited(makeLine(7, "amy", "short, edited"));
    edited.syncState(*state);
    edited.layout(*state, sc::scroll::itemLimits({40.0f, 5.0f}));
    EXPECT_EQ(ChatLineItem::wrapState(*state).wraps, 2);
    EXPECT_EQ(ChatLineItem::wrapState(*state).rows.front(), "amy: short, edited");

    item.layout(*state, sc::scroll::itemLimits({40.9f, 5.0f}));
    EXPECT_EQ(ChatLineItem::wrapState(*state).wraps, 2);
}

TEST(ChatLineItem, ViewportKeepsWrapCachePerMessage)
{
    using Viewport = sc::scroll::ScrollViewport<sc::chat::MessageId>;
    Viewport viewport;

    auto entriesFor = [](const std::vector<ChatLine> &lines) {
        std::vector<Viewport::Entry> entries;
        for (const auto &line : lines)
            entries.push_back({std::make_shared<ChatLineItem>(line), line.id});
        return entries;
    };

    std::vector<ChatLine> lines{makeLine(1, "a", "one two three"), makeLine(2, "b", "four")};
    viewport.layout(entriesFor(lines), sc::scroll::Rect{0.0f, 0.0f, 8.0f, 3.0f});
    EXPECT_FLOAT_EQ(viewport.contentBounds().height, 4.0f);
    EXPECT_FLOAT_EQ(viewport.translation(), 1.0f);

    lines.push_back(makeLine(3, "c", "five six"));
    viewport.layout(entriesFor(lines), sc::scroll::Rect{0.0f, 0.0f, 8.0f, 3.0f});

    EXPECT_EQ(ChatLineItem::wrapState(viewport.stateAt(0)).wraps, 1);
    EXPECT_EQ(ChatLineItem::wrapState(viewport.stateAt(2)).wraps, 1);
    EXPECT_FLOAT_EQ(viewport.contentBounds().height, 6.0f);
    EXPECT_FLOAT_EQ(viewport.translation(), 3.0f);
}
