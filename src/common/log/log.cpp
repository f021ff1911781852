#include "sc/log.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace sc::log
{
namespace
{
struct LogSink
{
    std::mutex mutex;
    std::filesystem::path path;
    std::ofstream stream;
    bool resolved = false;
    bool reportedFailure = false;
};

LogSink &sink()
{
    static LogSink instance;
    return instance;
}

const char *levelTag(Level level)
{
    switch (level)
    {
    case Level::Info:
        return "[info] ";
    case Level::Warning:
        return "[warn] ";
    case Level::Error:
        return "[error] ";
    }
    return "";
}

// Caller holds the sink mutex.
void openStream(LogSink &state, std::ios::openmode mode)
{
    state.stream.close();
    state.stream.clear();
    state.resolved = true;
    if (state.path.empty())
        return;
    state.stream.open(state.path, mode);
    if (!state.stream && !state.reportedFailure)
    {
        state.reportedFailure = true;
        std::cerr << "[sc-chat] failed to open log at '" << state.path.string() << "'\n";
    }
}

} // namespace

void setLogFile(const std::filesystem::path &path, bool truncate)
{
    LogSink &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.path = path;
    state.reportedFailure = false;
    openStream(state, truncate ? (std::ios::out | std::ios::trunc) : (std::ios::out | std::ios::app));
}

void write(Level level, std::string_view text)
{
    LogSink &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.resolved)
    {
        const char *env = std::getenv("SC_CHAT_LOG");
        if (env && *env)
            state.path = env;
        openStream(state, std::ios::out | std::ios::app);
    }
    if (!state.stream.is_open())
        return;

    state.stream << levelTag(level) << text;
    if (text.empty() || text.back() != '\n')
        state.stream << '\n';
    state.stream.flush();
}

} // namespace sc::log
