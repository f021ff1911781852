#include "replay_feed.hpp"

#include "sc/log.hpp"

#include <cmath>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace sc::chat
{
namespace
{

bool isBlank(std::string_view line)
{
    return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

} // namespace

ReplayFeed ReplayFeed::open(const std::filesystem::path &path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("cannot open replay file '" + path.string() + "'");
    return fromStream(in, path.string());
}

ReplayFeed ReplayFeed::fromStream(std::istream &in, const std::string &sourceName)
{
    ReplayFeed feed;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(in, line))
    {
        ++lineNumber;
        if (isBlank(line))
            continue;
        std::string error;
        std::optional<ReplayEntry> entry = parseLine(line, error);
        if (!entry)
        {
            ++feed.skipped_;
            sc::log::warn(sourceName + ":" + std::to_string(lineNumber) + ": skipped (" + error + ")");
            continue;
        }
        if (entry->history)
            feed.history_.push_back(std::move(*entry));
        else
            feed.live_.push_back(std::move(*entry));
    }
    sc::log::info("loaded " + std::to_string(feed.pending()) + " replay entries from " + sourceName);
    return feed;
}

std::optional<ReplayEntry> ReplayFeed::parseLine(std::string_view line, std::string &error)
{
    nlohmann::json json;
    try
    {
        json = nlohmann::json::parse(line.begin(), line.end());
    }
    catch (const nlohmann::json::parse_error &e)
    {
        error = e.what();
        return std::nullopt;
    }

    if (!json.is_object())
    {
        error = "not a JSON object";
        return std::nullopt;
    }

    auto user = json.find("user");
    auto text = json.find("text");
    if (user == json.end() || !user->is_string() || text == json.end() || !text->is_string())
    {
        error = "\"user\" and \"text\" must be strings";
        return std::nullopt;
    }

    ReplayEntry entry;
    entry.user = user->get<std::string>();
    entry.text = text->get<std::string>();
    entry.delay = kDefaultDelay;

    if (auto delay = json.find("delay_ms"); delay != json.end())
    {
        double milliseconds = delay->is_number() ? delay->get<double>() : -1.0;
        if (!std::isfinite(milliseconds) || milliseconds < 0.0 ||
            milliseconds > static_cast<double>(kMaxDelay.count()))
        {
            error = "\"delay_ms\" must be a number between 0 and " + std::to_string(kMaxDelay.count());
            return std::nullopt;
        }
        entry.delay = std::chrono::milliseconds(static_cast<std::int64_t>(milliseconds));
    }

    if (auto channel = json.find("channel"); channel != json.end())
    {
        if (!channel->is_string())
        {
            error = "\"channel\" must be a string";
            return std::nullopt;
        }
        entry.channel = channel->get<std::string>();
    }

    if (auto timestamp = json.find("timestamp_ms"); timestamp != json.end())
    {
        if (!timestamp->is_number_integer())
        {
            error = "\"timestamp_ms\" must be an integer";
            return std::nullopt;
        }
        entry.timestampMs = timestamp->get<std::int64_t>();
    }

    if (auto history = json.find("history"); history != json.end())
    {
        if (!history->is_boolean())
        {
            error = "\"history\" must be a boolean";
            return std::nullopt;
        }
        entry.history = history->get<bool>();
    }

    if (entry.history && !entry.timestampMs)
    {
        error = "history entries need \"timestamp_ms\"";
        return std::nullopt;
    }

    return entry;
}

void ReplayFeed::start(Clock::time_point now)
{
    started_ = true;
    due_ = now;
    if (nextLive_ < live_.size())
        due_ += live_[nextLive_].delay;
}

std::vector<ReplayEntry> ReplayFeed::poll(Clock::time_point now)
{
    std::vector<ReplayEntry> released;
    if (!started_)
        return released;

    released = std::move(history_);
    history_.clear();

    while (nextLive_ < live_.size() && now >= due_)
    {
        released.push_back(std::move(live_[nextLive_]));
        ++nextLive_;
        if (nextLive_ < live_.size())
            due_ += live_[nextLive_].delay;
    }
    return released;
}

std::optional<ReplayFeed::Clock::time_point> ReplayFeed::nextDue() const
{
    if (!started_ || nextLive_ >= live_.size())
        return std::nullopt;
    return due_;
}

} // namespace sc::chat
