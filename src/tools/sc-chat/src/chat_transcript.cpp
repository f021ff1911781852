#include "chat_transcript.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace sc::chat
{
namespace
{

char foldCase(char ch)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}

bool containsIgnoringCase(std::string_view haystack, std::string_view needle)
{
    if (needle.empty())
        return true;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) { return foldCase(a) == foldCase(b); });
    return it != haystack.end();
}

bool lineMatches(const ChatLine &line, std::string_view needle)
{
    return containsIgnoringCase(line.user + ": " + line.text, needle);
}

} // namespace

ChatTranscript::ChatTranscript(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity))
{
}

void ChatTranscript::setCapacity(std::size_t capacity)
{
    capacity_ = std::max<std::size_t>(1, capacity);
    if (lines_.size() > capacity_)
    {
        trim();
        ++revision_;
    }
}

MessageId ChatTranscript::append(std::string user, std::string text, std::int64_t timestampMs, bool local)
{
    ChatLine line;
    line.id = nextId();
    line.timestampMs = timestampMs;
    line.user = std::move(user);
    line.text = std::move(text);
    line.local = local;
    MessageId id = line.id;

    lines_.push_back(std::move(line));
    trim();
    ++revision_;
    return id;
}

std::optional<MessageId> ChatTranscript::insertHistory(std::string user, std::string text, std::int64_t timestampMs)
{
    auto position = std::upper_bound(lines_.begin(), lines_.end(), timestampMs,
                                     [](std::int64_t ts, const ChatLine &other) { return ts < other.timestampMs; });
    if (position == lines_.begin() && lines_.size() >= capacity_)
        return std::nullopt;

    ChatLine line;
    line.id = nextId();
    line.timestampMs = timestampMs;
    line.user = std::move(user);
    line.text = std::move(text);
    MessageId id = line.id;

    lines_.insert(position, std::move(line));
    trim();
    ++revision_;
    return id;
}

std::optional<std::size_t> ChatTranscript::indexOf(MessageId id) const noexcept
{
    // Ids increase along appends, but history merges break the ordering.
    for (std::size_t i = 0; i < lines_.size(); ++i)
    {
        if (lines_[i].id == id)
            return i;
    }
    return std::nullopt;
}

std::optional<std::size_t> ChatTranscript::find(std::string_view needle, std::size_t from) const
{
    if (lines_.empty())
        return std::nullopt;
    std::size_t start = from < lines_.size() ? from : 0;
    for (std::size_t step = 0; step < lines_.size(); ++step)
    {
        std::size_t index = (start + step) % lines_.size();
        if (lineMatches(lines_[index], needle))
            return index;
    }
    return std::nullopt;
}

void ChatTranscript::trim()
{
    while (lines_.size() > capacity_)
        lines_.pop_front();
}

} // namespace sc::chat
