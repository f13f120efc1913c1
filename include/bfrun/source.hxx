/*
    Bfrun - A bounds-checked brainfuck interpreter
    Source file loading
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <string>

namespace bfrun {
// Reads the whole file at `path` into `out`, byte for byte; scanning needs every character for
// line and column tracking. Returns true on success; on error, 'err' is set and 'out' left
// unchanged.
bool readSource(const std::string& path, std::string& out, std::string& err);
}  // namespace bfrun
