#include "chat_window.hpp"
#include "chat_app.hpp"
#include "transcript_view.hpp"
#include "../commands.hpp"

#include "sc/log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <utility>

// Variable Name        | Meaning
// ---------------------|---------------------------------------------------------------
// transcriptView       | The scroll viewport host showing this channel's chat lines.
// transcriptScrollBar  | Vertical scroll bar kept in sync with the viewport offset.
// jumpButton           | "Jump to Bottom", visible only while reading history.
// messageInput         | Single line input for outgoing messages.
// sendButton           | Sends the contents of messageInput.

namespace
{
    constexpr int kScrollBarWidth = 1;
    constexpr int kSendButtonWidth = 10;
    constexpr int kJumpButtonWidth = 18;
    constexpr int kMaxMessageLength = 255;

    std::int64_t wallClockMs()
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

    std::string trimmed(const char *text)
    {
        std::string value(text ? text : "");
        auto begin = value.find_first_not_of(" \t");
        if (begin == std::string::npos)
            return std::string();
        auto end = value.find_last_not_of(" \t");
        return value.substr(begin, end - begin + 1);
    }
}

ChatWindow::ChatWindow(ChatApp &owner, const TRect &bounds, int number, std::string channel)
    : TWindowInit(&ChatWindow::initFrame),
      TWindow(bounds, ("#" + channel).c_str(), number),
      app(owner),
      channel_(std::move(channel)),
      viewportId_("chat/" + channel_ + "/" + std::to_string(number)),
      transcript_(app.scrollbackLimit())
{
    options |= ofTileable;

    TRect extent = getExtent();
    extent.grow(-1, -1);

    short inputTop = static_cast<short>(extent.b.y - 2);
    if (inputTop <= extent.a.y + 3)
        inputTop = static_cast<short>(extent.a.y + 4);

    TRect transcriptScrollRect(static_cast<short>(extent.b.x - kScrollBarWidth), extent.a.y,
                               extent.b.x, static_cast<short>(inputTop - 1));
    transcriptScrollBar = new TScrollBar(transcriptScrollRect);
    transcriptScrollBar->growMode = gfGrowLoX | gfGrowHiX | gfGrowHiY;
    insert(transcriptScrollBar);

    TRect transcriptRect(extent.a.x, extent.a.y,
                         static_cast<short>(extent.b.x - kScrollBarWidth), static_cast<short>(inputTop - 1));
    transcriptView = new TranscriptView(transcriptRect, transcriptScrollBar, transcript_,
                                        app.viewports(), viewportId_);
    transcriptView->growMode = gfGrowHiX | gfGrowHiY;
    transcriptView->setScrollCallback([this](const sc::scroll::ViewportSnapshot &snapshot)
                                      { setJumpButtonVisible(!snapshot.isAtBottom()); });
    insert(transcriptView);

    // Floats over the bottom right corner of the transcript.
    TRect jumpRect(static_cast<short>(transcriptRect.b.x - kJumpButtonWidth - 1),
                   static_cast<short>(transcriptRect.b.y - 2),
                   static_cast<short>(transcriptRect.b.x - 1), transcriptRect.b.y);
    jumpButton = new TButton(jumpRect, "~J~ump to Bottom", cmJumpToBottom, bfNormal);
    jumpButton->growMode = gfGrowLoX | gfGrowHiX | gfGrowLoY | gfGrowHiY;
    jumpButton->options &= ~ofSelectable;
    insert(jumpButton);
    jumpButton->hide();

    TRect inputRect(extent.a.x, inputTop,
                    static_cast<short>(extent.b.x - kSendButtonWidth - 1), static_cast<short>(inputTop + 1));
    messageInput = new TInputLine(inputRect, kMaxMessageLength);
    messageInput->growMode = gfGrowHiX | gfGrowLoY | gfGrowHiY;
    insert(messageInput);

    TRect sendRect(static_cast<short>(extent.b.x - kSendButtonWidth), inputTop,
                   extent.b.x, static_cast<short>(inputTop + 2));
    sendButton = new TButton(sendRect, "~S~end", cmSendMessage, bfDefault);
    sendButton->growMode = gfGrowLoX | gfGrowHiX | gfGrowLoY | gfGrowHiY;
    insert(sendButton);

    messageInput->select();
    app.registerWindow(this);
}

TPalette &ChatWindow::getPalette() const
{
    static TPalette palette(cpGrayDialog, sizeof(cpGrayDialog) - 1);
    return palette;
}

void ChatWindow::handleEvent(TEvent &event)
{
    if (event.what == evKeyDown && event.keyDown.keyCode == kbEnter && messageInput &&
        messageInput->getState(sfFocused))
    {
        sendMessage();
        clearEvent(event);
        return;
    }

    if (event.what == evCommand)
    {
        switch (event.message.command)
        {
        case cmSendMessage:
            sendMessage();
            clearEvent(event);
            return;
        case cmJumpToBottom:
            app.viewports().snapToEnd(viewportId_);
            clearEvent(event);
            return;
        case cmJumpToTop:
            app.viewports().snapToStart(viewportId_);
            clearEvent(event);
            return;
        case cmFindInScrollback:
            findInScrollback();
            clearEvent(event);
            return;
        case cmFindNext:
            findNext();
            clearEvent(event);
            return;
        default:
            break;
        }
    }

    TWindow::handleEvent(event);

    // The input line leaves page keys alone; they scroll the transcript.
    if (event.what == evKeyDown && transcriptView && transcriptView->scrollPage(event.keyDown.keyCode))
        clearEvent(event);
}

void ChatWindow::sizeLimits(TPoint &min, TPoint &max)
{
    TWindow::sizeLimits(min, max);
    constexpr short minWidth = 50;
    constexpr short minHeight = 16;
    if (min.x < minWidth)
        min.x = minWidth;
    if (min.y < minHeight)
        min.y = minHeight;
    (void)max;
}

void ChatWindow::shutDown()
{
    app.unregisterWindow(this);
    TWindow::shutDown();
    transcriptView = nullptr;
    transcriptScrollBar = nullptr;
    jumpButton = nullptr;
    messageInput = nullptr;
    sendButton = nullptr;
}

void ChatWindow::deliver(const sc::chat::ReplayEntry &entry)
{
    std::int64_t timestamp = entry.timestampMs.value_or(wallClockMs());
    if (entry.history)
    {
        if (!transcript_.insertHistory(entry.user, entry.text, timestamp))
            sc::log::info("#" + channel_ + ": history line older than the scrollback dropped");
    }
    else
        transcript_.append(entry.user, entry.text, timestamp);
}

void ChatWindow::tick(std::chrono::steady_clock::time_point now)
{
    if (transcriptView)
        transcriptView->tick(now);
}

void ChatWindow::applySettings(bool naturalScrolling, float animationRate, std::size_t scrollbackLimit)
{
    transcript_.setCapacity(scrollbackLimit);
    if (!transcriptView)
        return;
    transcriptView->setNaturalScrolling(naturalScrolling);
    transcriptView->setAnimationRate(animationRate);
}

void ChatWindow::sendMessage()
{
    if (!messageInput)
        return;
    std::string text = trimmed(messageInput->data);
    if (text.empty())
        return;

    transcript_.append(app.userName(), text, wallClockMs(), true);
    sc::log::info("#" + channel_ + " <" + app.userName() + "> " + text);

    messageInput->data[0] = EOS;
    messageInput->selectAll(True);
    messageInput->drawView();

    // Sending while reading history brings the new line into view.
    app.viewports().snapToEnd(viewportId_);
}

void ChatWindow::findInScrollback()
{
    char buffer[kMaxMessageLength + 1] = {};
    std::strncpy(buffer, findText_.c_str(), kMaxMessageLength);
    if (inputBox("Find", "~T~ext", buffer, kMaxMessageLength) != cmOK)
        return;
    findText_ = trimmed(buffer);
    lastMatch_.reset();
    if (findText_.empty())
        return;
    jumpToMatch(0);
}

void ChatWindow::findNext()
{
    if (findText_.empty())
    {
        findInScrollback();
        return;
    }
    jumpToMatch(lastMatch_ ? *lastMatch_ + 1 : 0);
}

void ChatWindow::jumpToMatch(std::size_t from)
{
    std::optional<std::size_t> match = transcript_.find(findText_, from);
    if (!match)
    {
        messageBox(("No line contains \"" + findText_ + "\".").c_str(), mfInformation | mfOKButton);
        return;
    }
    lastMatch_ = match;
    // Item indices address the last layout; bring it up to date first.
    if (transcriptView)
        transcriptView->tick(std::chrono::steady_clock::now());
    app.viewports().scrollToItem(viewportId_, static_cast<std::ptrdiff_t>(*match));
}

void ChatWindow::setJumpButtonVisible(bool visible)
{
    if (!jumpButton)
        return;
    if (visible == jumpButton->getState(sfVisible))
        return;
    if (visible)
        jumpButton->show();
    else
        jumpButton->hide();
}
