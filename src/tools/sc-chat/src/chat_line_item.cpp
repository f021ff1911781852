#include "chat_line_item.hpp"

#include "text_width.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace sc::chat
{

ChatLineItem::ChatLineItem(const ChatLine &line)
    : local_(line.local),
      prefixColumns_(text::displayWidth(line.user) + 2),
      formatted_(line.user + ": " + line.text)
{
}

std::unique_ptr<scroll::ItemState> ChatLineItem::createState() const
{
    auto state = std::make_unique<WrapState>();
    state->source = formatted_;
    state->prefixColumns = prefixColumns_;
    state->local = local_;
    return state;
}

void ChatLineItem::syncState(scroll::ItemState &state) const
{
    auto &wrap = static_cast<WrapState &>(state);
    wrap.local = local_;
    if (wrap.source == formatted_)
        return;
    wrap.source = formatted_;
    wrap.prefixColumns = prefixColumns_;
    wrap.columns = -1;
}

scroll::Size ChatLineItem::layout(scroll::ItemState &state, const scroll::Limits &limits) const
{
    auto &wrap = static_cast<WrapState &>(state);

    int columns = 1;
    if (std::isfinite(limits.max.width))
        columns = std::max(1, static_cast<int>(std::floor(limits.max.width)));
    else
        columns = std::numeric_limits<int>::max();

    if (wrap.columns != columns)
    {
        wrap.rows = text::wrap(wrap.source, columns);
        wrap.widestRow = 0;
        for (const auto &row : wrap.rows)
            wrap.widestRow = std::max(wrap.widestRow, text::displayWidth(row));
        wrap.columns = columns;
        ++wrap.wraps;
    }

    return scroll::Size{static_cast<float>(wrap.widestRow), static_cast<float>(wrap.rows.size())};
}

const WrapState &ChatLineItem::wrapState(const scroll::ItemState &state)
{
    return static_cast<const WrapState &>(state);
}

} // namespace sc::chat
