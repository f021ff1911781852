#pragma once

#include "sc/commands/sc_chat.hpp"

inline constexpr unsigned short cmNewChannel = sc::commands::chat::NewChannel;
inline constexpr unsigned short cmAbout = sc::commands::chat::About;
inline constexpr unsigned short cmSendMessage = sc::commands::chat::SendMessage;
inline constexpr unsigned short cmJumpToBottom = sc::commands::chat::JumpToBottom;
inline constexpr unsigned short cmJumpToTop = sc::commands::chat::JumpToTop;
inline constexpr unsigned short cmFindInScrollback = sc::commands::chat::FindInScrollback;
inline constexpr unsigned short cmFindNext = sc::commands::chat::FindNext;
inline constexpr unsigned short cmToggleNaturalScrolling = sc::commands::chat::ToggleNaturalScrolling;
