#pragma once

#include "sc/options.hpp"

#include <cstddef>
#include <string>

namespace sc::chat
{

inline constexpr char kOptionNaturalScrolling[] = "naturalScrolling";
inline constexpr char kOptionScrollbackLimit[] = "scrollbackLimit";
inline constexpr char kOptionAnimationRate[] = "animationRate";
inline constexpr char kOptionChannels[] = "channels";
inline constexpr char kOptionUserName[] = "userName";

inline constexpr std::size_t kDefaultScrollbackLimit = 500;
inline constexpr int kDefaultAnimationRate = 30;
inline constexpr char kDefaultUserName[] = "you";

void registerChatOptions(config::OptionRegistry &registry);

// Option values clamped to what the transcript and the animator accept.
std::size_t scrollbackLimit(const config::OptionRegistry &registry);
float animationRate(const config::OptionRegistry &registry);
// Name shown on locally sent lines; never empty.
std::string userName(const config::OptionRegistry &registry);

} // namespace sc::chat
