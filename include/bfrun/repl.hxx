/*
    Bfrun - A bounds-checked brainfuck interpreter
    REPL API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#ifdef BFRUN_ENABLE_REPL
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

#include "ansi.hxx"
#include "vm.hxx"

namespace bfrun {
struct ReplConfig {
    bool skipNewlines;
    bool highlightChanges;
    bool searchActive;
    uint64_t searchValue;
};

int runRepl(Machine& machine, ReplConfig& cfg);

// Fills `changed` with the indices where `prev` and `curr` differ, over their common length.
void diffCells(const std::vector<Cell>& prev, const std::vector<Cell>& curr,
               std::vector<size_t>& changed);

inline void dumpMemory(const Machine& machine, std::ostream& out = std::cout,
                       const std::vector<size_t>* changed = nullptr, bool highlight = false,
                       bool searchActive = false, uint64_t searchValue = 0) {
    const auto& cells = machine.cells;
    const size_t cellPtr = machine.cellPtr;
    if (cells.empty()) {
        out << "Memory dump:" << '\n' << "<empty>" << std::endl;
        return;
    }
    size_t lastNonEmpty = cells.size() - 1;
    while (lastNonEmpty > cellPtr && lastNonEmpty > 0 && !cells[lastNonEmpty]) {
        --lastNonEmpty;
    }
    out << "Memory dump:" << '\n'
        << ansi::underline << "row+col |0  |1  |2  |3  |4  |5  |6  |7  |8  |9  |" << ansi::reset
        << std::endl;
    size_t end = std::max(lastNonEmpty, std::min(cellPtr, cells.size() - 1));
    for (size_t i = 0, row = 0; i <= end; ++i) {
        if (i % 10 == 0) {
            if (row) out << std::endl;
            std::string rowStr = std::to_string(row);
            size_t rowPad = rowStr.length() < 8 ? 8 - rowStr.length() : 0;
            out << rowStr << std::string(rowPad, ' ') << "|";
            row += 10;
        }
        bool changedCell = highlight && changed &&
                           std::find(changed->begin(), changed->end(), i) != changed->end();
        bool match = searchActive && static_cast<uint64_t>(cells[i]) == searchValue;
        const auto& color = i == cellPtr  ? ansi::green
                            : match       ? ansi::red
                            : changedCell ? ansi::yellow
                                          : ansi::reset;
        std::string cellStr = std::to_string(cells[i]);
        size_t cellPad = cellStr.length() < 3 ? 3 - cellStr.length() : 0;
        out << color << cellStr << ansi::reset << std::string(cellPad, ' ') << "|";
    }
    out << ansi::reset << std::endl;
}
}  // namespace bfrun
#endif  // BFRUN_ENABLE_REPL
