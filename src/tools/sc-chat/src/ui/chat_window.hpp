#pragma once

#include "../chat_transcript.hpp"
#include "../replay_feed.hpp"
#include "../tvision_include.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

class ChatApp;
class TranscriptView;
class TButton;
class TInputLine;
class TScrollBar;

// One channel: the transcript, its scroll bar, a "Jump to Bottom" button that
// shows while the user reads history, and the message input line.
class ChatWindow : public TWindow
{
public:
    ChatWindow(ChatApp &owner, const TRect &bounds, int number, std::string channel);

    virtual void handleEvent(TEvent &event) override;
    virtual void sizeLimits(TPoint &min, TPoint &max) override;
    virtual void shutDown() override;
    virtual TPalette &getPalette() const override;

    const std::string &channel() const noexcept { return channel_; }
    const std::string &viewportId() const noexcept { return viewportId_; }
    const sc::chat::ChatTranscript &transcript() const noexcept { return transcript_; }

    void deliver(const sc::chat::ReplayEntry &entry);
    void tick(std::chrono::steady_clock::time_point now);
    void applySettings(bool naturalScrolling, float animationRate, std::size_t scrollbackLimit);

private:
    void sendMessage();
    void findInScrollback();
    void findNext();
    void jumpToMatch(std::size_t from);
    void setJumpButtonVisible(bool visible);

    ChatApp &app;
    std::string channel_;
    std::string viewportId_;
    sc::chat::ChatTranscript transcript_;
    TranscriptView *transcriptView = nullptr;
    TScrollBar *transcriptScrollBar = nullptr;
    TButton *jumpButton = nullptr;
    TInputLine *messageInput = nullptr;
    TButton *sendButton = nullptr;

    std::string findText_;
    std::optional<std::size_t> lastMatch_;
};
