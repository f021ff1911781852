#pragma once

#include <filesystem>
#include <string_view>

namespace sc::log
{

enum class Level
{
    Info,
    Warning,
    Error
};

// Log output goes to the file set here, or to $SC_CHAT_LOG when no file was set.
// Without either, entries are dropped.
void setLogFile(const std::filesystem::path &path, bool truncate = false);

void write(Level level, std::string_view text);

inline void info(std::string_view text) { write(Level::Info, text); }
inline void warn(std::string_view text) { write(Level::Warning, text); }
inline void error(std::string_view text) { write(Level::Error, text); }

} // namespace sc::log
