#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sc::chat
{

struct ReplayEntry
{
    std::string user;
    std::string text;
    std::string channel;
    std::chrono::milliseconds delay{500};
    std::optional<std::int64_t> timestampMs;
    // Backfilled lines are released on the first poll and merged by timestamp.
    bool history = false;
};

// Chat lines read from a JSON-lines file, one object per line:
//   {"user": "name", "text": "message", "delay_ms": 250}
// Optional keys: "channel", "timestamp_ms", "history". A live entry becomes
// due `delay_ms` after the previous live entry.
class ReplayFeed
{
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kDefaultDelay{500};
    // Longest accepted "delay_ms": one day.
    static constexpr std::chrono::milliseconds kMaxDelay{86'400'000};

    // Throws std::runtime_error if the file cannot be opened.
    static ReplayFeed open(const std::filesystem::path &path);
    static ReplayFeed fromStream(std::istream &in, const std::string &sourceName = "<stream>");

    // Parses one line. On failure returns nothing and describes the problem in `error`.
    static std::optional<ReplayEntry> parseLine(std::string_view line, std::string &error);

    void start(Clock::time_point now);
    bool started() const noexcept { return started_; }

    // Entries that became due since the last poll, in file order.
    std::vector<ReplayEntry> poll(Clock::time_point now);

    bool finished() const noexcept { return nextLive_ >= live_.size() && history_.empty(); }
    std::size_t pending() const noexcept { return live_.size() - nextLive_ + history_.size(); }
    std::size_t skippedLines() const noexcept { return skipped_; }

    // Time of the next live entry, if any.
    std::optional<Clock::time_point> nextDue() const;

private:
    std::vector<ReplayEntry> history_;
    std::vector<ReplayEntry> live_;
    std::size_t nextLive_ = 0;
    std::size_t skipped_ = 0;
    bool started_ = false;
    Clock::time_point due_{};
};

} // namespace sc::chat
