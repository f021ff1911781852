#pragma once

#include <cstdint>

namespace sc::commands::chat
{

inline constexpr std::uint16_t NewChannel = 1000;
inline constexpr std::uint16_t About = 1001;
inline constexpr std::uint16_t SendMessage = 1002;
inline constexpr std::uint16_t JumpToBottom = 1003;
inline constexpr std::uint16_t JumpToTop = 1004;
inline constexpr std::uint16_t FindInScrollback = 1005;
inline constexpr std::uint16_t FindNext = 1006;
inline constexpr std::uint16_t ToggleNaturalScrolling = 1007;

} // namespace sc::commands::chat
