/*
    Bfrun - A bounds-checked brainfuck interpreter
    Error reporting
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "bfrun/diagnostics.hxx"

#include <ostream>
#include <string_view>

#include "bfrun/ansi.hxx"

std::string_view bfrun::describe(Status status, cmdType op) {
    switch (status) {
        case Status::Ok:
            return "OK";
        case Status::UnmatchedLoopEnd:
            return "Unmatched close bracket";
        case Status::UnmatchedLoopStart:
            return "Unmatched open bracket";
        case Status::ExcessiveLoopDepth:
            return "Nested loop limit exceeded";
        case Status::PointerOutOfBounds:
            return op == cmdType::MOV_LFT ? "Cell pointer moved before start"
                                          : "Cell pointer moved beyond end";
    }
    return "Unknown error";
}

void bfrun::reportFault(const Fault& fault, std::ostream& out, bool color) {
    if (fault.status == Status::Ok) return;
    if (color)
        out << ansi::red << "ERROR:" << ansi::reset;
    else
        out << "ERROR:";
    out << ' ' << describe(fault.status, fault.where.op) << " (line " << fault.where.line
        << ", column " << fault.where.column << ')' << std::endl;
}
