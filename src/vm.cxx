/*
    Bfrun - A bounds-checked brainfuck interpreter
    VM implementation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "bfrun/vm.hxx"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <string_view>
#include <vector>

using bfrun::Cell;
using bfrun::cmdType;
using bfrun::Status;

namespace {
constexpr Cell kReplacementChar = 0xFFFD;

// Encodes `value` as UTF-8 into `buf`, returns the byte count. Anything that is not a Unicode
// scalar value comes out as U+FFFD.
inline size_t encodeUtf8(Cell value, char (&buf)[4]) {
    if (value < 0x80) {
        buf[0] = static_cast<char>(value);
        return 1;
    }
    if (value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) value = kReplacementChar;
    if (value < 0x800) {
        buf[0] = static_cast<char>(0xC0 | (value >> 6));
        buf[1] = static_cast<char>(0x80 | (value & 0x3F));
        return 2;
    }
    if (value < 0x10000) {
        buf[0] = static_cast<char>(0xE0 | (value >> 12));
        buf[1] = static_cast<char>(0x80 | ((value >> 6) & 0x3F));
        buf[2] = static_cast<char>(0x80 | (value & 0x3F));
        return 3;
    }
    buf[0] = static_cast<char>(0xF0 | (value >> 18));
    buf[1] = static_cast<char>(0x80 | ((value >> 12) & 0x3F));
    buf[2] = static_cast<char>(0x80 | ((value >> 6) & 0x3F));
    buf[3] = static_cast<char>(0x80 | (value & 0x3F));
    return 4;
}

inline Status fail(bfrun::Fault* fault, Status status, const bfrun::command& where) {
    if (fault) {
        fault->status = status;
        fault->where = where;
    }
    return status;
}

template <bool Profile>
Status executeImpl(bfrun::Machine& machine, const std::vector<bfrun::command>& program,
                   const std::vector<size_t>& jumps, bool skipNewlines,
                   bfrun::ProfileInfo* profile, bfrun::Fault* fault) {
    static void* jtable[] = {&&_MOV_RGT, &&_MOV_LFT, &&_INC,     &&_DEC,
                             &&_PUT_CHR, &&_RAD_CHR, &&_JMP_ZER, &&_JMP_NOT_ZER};

    Cell* __restrict cellBase = machine.cells.data();
    const size_t tapeSize = machine.cells.size();
    const size_t count = program.size();
    size_t cellPtr = machine.cellPtr;
    size_t ip = 0;
    size_t openLoops = 0;

#define DISPATCH()                                          \
    if (ip == count) [[unlikely]]                           \
        goto _END;                                          \
    if constexpr (Profile) ++profile->instructions;         \
    goto* jtable[static_cast<size_t>(program[ip].op)];
#define NEXT() \
    ++ip;      \
    DISPATCH()

    DISPATCH();

_MOV_RGT:
    if (cellPtr + 1 >= tapeSize) [[unlikely]] {
        machine.cellPtr = cellPtr;
        return fail(fault, Status::PointerOutOfBounds, program[ip]);
    }
    ++cellPtr;
    NEXT();

_MOV_LFT:
    if (cellPtr == 0) [[unlikely]] {
        machine.cellPtr = cellPtr;
        return fail(fault, Status::PointerOutOfBounds, program[ip]);
    }
    --cellPtr;
    NEXT();

_INC:
    ++cellBase[cellPtr];
    NEXT();

_DEC:
    --cellBase[cellPtr];
    NEXT();

_PUT_CHR: {
    char buf[4];
    const size_t len = encodeUtf8(cellBase[cellPtr], buf);
    std::cout.write(buf, static_cast<std::streamsize>(len));
    std::cout.flush();
    NEXT();
}

_RAD_CHR: {
    int in = std::cin.get();
    if (skipNewlines) {
        while (in == '\n') in = std::cin.get();
    }
    cellBase[cellPtr] = in == EOF ? 0 : static_cast<Cell>(static_cast<unsigned char>(in));
    NEXT();
}

_JMP_ZER:
    if (!cellBase[cellPtr]) {
        ip = jumps[ip];
    } else {
        if (openLoops == BFRUN_MAX_LOOP_DEPTH) [[unlikely]] {
            machine.cellPtr = cellPtr;
            return fail(fault, Status::ExcessiveLoopDepth, program[ip]);
        }
        ++openLoops;
    }
    NEXT();

// Jumping back lands on the `[` and steps past it, so the loop stays counted as open
_JMP_NOT_ZER:
    if (cellBase[cellPtr]) [[likely]] {
        ip = jumps[ip];
        if constexpr (Profile) ++profile->loopIterations;
    } else {
        --openLoops;
    }
    NEXT();

#undef NEXT
#undef DISPATCH

_END:
    machine.cellPtr = cellPtr;
    return Status::Ok;
}
}  // namespace

void bfrun::Machine::reset() {
    std::fill(cells.begin(), cells.end(), 0);
    cellPtr = 0;
}

Status bfrun::resolveBrackets(const std::vector<command>& program, std::vector<size_t>& jumps,
                              Fault* fault) {
    jumps.assign(program.size(), 0);
    std::vector<size_t> stack;
    for (size_t i = 0; i < program.size(); ++i) {
        const cmdType op = program[i].op;
        if (op == cmdType::JMP_ZER) {
            stack.push_back(i);
        } else if (op == cmdType::JMP_NOT_ZER) {
            if (stack.empty()) return fail(fault, Status::UnmatchedLoopEnd, program[i]);
            const size_t start = stack.back();
            stack.pop_back();
            jumps[start] = i;
            jumps[i] = start;
        }
    }
    // The outermost open loop is the first one that can never close.
    if (!stack.empty()) return fail(fault, Status::UnmatchedLoopStart, program[stack.front()]);
    return Status::Ok;
}

Status bfrun::execute(Machine& machine, const std::vector<command>& program, bool skipNewlines,
                      ProfileInfo* profile, Fault* fault) {
    std::chrono::steady_clock::time_point start;
    if (profile) {
        *profile = ProfileInfo{};
        start = std::chrono::steady_clock::now();
    }
    std::vector<size_t> jumps;
    Status ret = resolveBrackets(program, jumps, fault);
    if (ret == Status::Ok) {
        ret = profile
                  ? executeImpl<true>(machine, program, jumps, skipNewlines, profile, fault)
                  : executeImpl<false>(machine, program, jumps, skipNewlines, nullptr, fault);
    }
    if (profile)
        profile->seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return ret;
}

Status bfrun::execute(Machine& machine, std::string_view source, bool skipNewlines,
                      ProfileInfo* profile, Fault* fault) {
    const std::vector<command> program = scan(source);
    return execute(machine, program, skipNewlines, profile, fault);
}
