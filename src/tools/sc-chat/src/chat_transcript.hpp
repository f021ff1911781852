#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>

namespace sc::chat
{

using MessageId = std::uint64_t;

struct ChatLine
{
    MessageId id = 0;
    std::int64_t timestampMs = 0;
    std::string user;
    std::string text;
    bool local = false;
};

// Bounded scrollback of one channel. Every line gets a fresh id that is never
// reused, so ids stay valid keys for the viewport across trims and merges.
class ChatTranscript
{
public:
    static constexpr std::size_t kDefaultCapacity = 500;

    explicit ChatTranscript(std::size_t capacity = kDefaultCapacity);

    std::size_t capacity() const noexcept { return capacity_; }
    // Drops the oldest lines if the transcript is over the new capacity.
    void setCapacity(std::size_t capacity);

    MessageId append(std::string user, std::string text, std::int64_t timestampMs, bool local = false);

    // Places a backfilled line by timestamp: before the first line that is
    // newer, or at the end. Trims from the front like append(). Returns nothing,
    // and leaves the transcript unchanged, if the line is older than everything
    // in a full transcript.
    std::optional<MessageId> insertHistory(std::string user, std::string text, std::int64_t timestampMs);

    const std::deque<ChatLine> &lines() const noexcept { return lines_; }
    std::size_t size() const noexcept { return lines_.size(); }
    bool empty() const noexcept { return lines_.empty(); }
    const ChatLine &at(std::size_t index) const { return lines_.at(index); }

    std::optional<std::size_t> indexOf(MessageId id) const noexcept;

    // Case-insensitive search over "user: text", starting at `from` and
    // wrapping around once.
    std::optional<std::size_t> find(std::string_view needle, std::size_t from = 0) const;

    // Bumped on every change.
    std::uint64_t revision() const noexcept { return revision_; }

private:
    MessageId nextId() noexcept { return nextId_++; }
    void trim();

    std::deque<ChatLine> lines_;
    std::size_t capacity_;
    MessageId nextId_ = 1;
    std::uint64_t revision_ = 0;
};

} // namespace sc::chat
