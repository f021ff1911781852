#pragma once

#include "chat_transcript.hpp"

#include "sc/scroll/scroll_item.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sc::chat
{

// Wrapped rows of one chat line, kept across frames by the viewport so that
// a line is only re-wrapped when its text or the available width changes.
struct WrapState : scroll::ItemState
{
    std::string source;
    int columns = -1;
    int prefixColumns = 0;
    // Sent from this client rather than received.
    bool local = false;
    int widestRow = 0;
    std::vector<std::string> rows;
    int wraps = 0;
};

// One transcript line as a scroll item, rendered as "user: text" and one unit
// tall per terminal row.
class ChatLineItem : public scroll::ScrollItem
{
public:
    explicit ChatLineItem(const ChatLine &line);

    std::unique_ptr<scroll::ItemState> createState() const override;
    void syncState(scroll::ItemState &state) const override;
    scroll::Size layout(scroll::ItemState &state, const scroll::Limits &limits) const override;

    static const WrapState &wrapState(const scroll::ItemState &state);

private:
    bool local_;
    int prefixColumns_;
    std::string formatted_;
};

} // namespace sc::chat
