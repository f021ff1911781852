#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sc::chat::text
{

// Decodes the UTF-8 sequence at `index` and advances past it. Invalid bytes
// are returned as themselves and consume one byte.
std::uint32_t nextCodepoint(std::string_view text, std::size_t &index);

// Terminal columns taken by one codepoint: 0 for control and combining
// marks, 2 for East Asian wide characters and emoji, 1 otherwise.
int codepointWidth(std::uint32_t codepoint);

int displayWidth(std::string_view text);

// Greedy word wrap to `columns` display columns. Words longer than a row are
// broken between glyphs; '\n' always starts a new row. Returns at least one row.
std::vector<std::string> wrap(std::string_view text, int columns);

} // namespace sc::chat::text
