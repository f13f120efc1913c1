/*
    Bfrun - A bounds-checked brainfuck interpreter
    VM API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#define BFRUN_TAPE_CELLS 30000
#define BFRUN_MAX_LOOP_DEPTH 32767
#define BFRUN_DEFAULT_SKIP_NEWLINES 0

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bfrun {

using Cell = std::uint32_t;

enum class cmdType : uint8_t {
    MOV_RGT,
    MOV_LFT,
    INC,
    DEC,
    PUT_CHR,
    RAD_CHR,
    JMP_ZER,
    JMP_NOT_ZER,
};

struct command {
    uint32_t line;
    uint32_t column;
    cmdType op = cmdType{};
};

using Program = std::vector<command>;

enum class Status : int {
    Ok = 0,
    UnmatchedLoopEnd = 1,
    UnmatchedLoopStart = 2,
    ExcessiveLoopDepth = 3,
    PointerOutOfBounds = 4,
};

// Where and why a run stopped.
struct Fault {
    Status status = Status::Ok;
    command where{};
};

struct ProfileInfo {
    std::uint64_t instructions = 0;
    std::uint64_t loopIterations = 0;
    double seconds = 0.0;
};

// Tape and data pointer for one program run. A fresh Machine is an all-zero tape with the
// pointer on cell 0.
struct Machine {
    std::vector<Cell> cells = std::vector<Cell>(BFRUN_TAPE_CELLS, 0);
    size_t cellPtr = 0;

    void reset();
};
}  // namespace bfrun

#include "vm/scanner.hxx"
#include "vm/executor.hxx"
