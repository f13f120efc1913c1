#pragma once

#include <string_view>
#include <vector>

namespace bfrun {
struct command;

/// @brief Turns source text into the command sequence the executor runs.
/// @param source Raw program text. Every byte outside `><+-.,[]` is dropped but still advances
/// the position counters: `\n` starts a new line, any other character moves one column.
/// UTF-8 continuation bytes do not count as characters.
/// @return Commands in source order, tagged with their 1-based line and column.
std::vector<command> scan(std::string_view source);
}  // namespace bfrun
