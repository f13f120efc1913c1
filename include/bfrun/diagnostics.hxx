/*
    Bfrun - A bounds-checked brainfuck interpreter
    Error reporting
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <iostream>
#include <ostream>
#include <string_view>

#include "vm.hxx"

namespace bfrun {
// Human readable message for a status. `op` picks the direction for PointerOutOfBounds.
std::string_view describe(Status status, cmdType op = cmdType{});

/// @brief Writes the one-line diagnostic for a failed run:
/// `ERROR: <message> (line L, column C)`.
/// @param color Paint the `ERROR:` tag red.
void reportFault(const Fault& fault, std::ostream& out = std::cerr, bool color = false);

// Exit code for the CLI.
inline int exitCode(Status status) { return status == Status::Ok ? 0 : 1; }
}  // namespace bfrun
