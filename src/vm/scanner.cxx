/*
    Bfrun - A bounds-checked brainfuck interpreter
    Source scanner
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "bfrun/vm/scanner.hxx"

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "bfrun/vm.hxx"

namespace {
using bfrun::cmdType;

struct OpEntry {
    bool valid;
    cmdType op;
};

constexpr std::array<OpEntry, 256> charToOpcode = [] {
    std::array<OpEntry, 256> table{};
    table[static_cast<unsigned char>('>')] = {true, cmdType::MOV_RGT};
    table[static_cast<unsigned char>('<')] = {true, cmdType::MOV_LFT};
    table[static_cast<unsigned char>('+')] = {true, cmdType::INC};
    table[static_cast<unsigned char>('-')] = {true, cmdType::DEC};
    table[static_cast<unsigned char>('.')] = {true, cmdType::PUT_CHR};
    table[static_cast<unsigned char>(',')] = {true, cmdType::RAD_CHR};
    table[static_cast<unsigned char>('[')] = {true, cmdType::JMP_ZER};
    table[static_cast<unsigned char>(']')] = {true, cmdType::JMP_NOT_ZER};
    return table;
}();

inline bool isContinuationByte(unsigned char ch) { return (ch & 0xC0u) == 0x80u; }
}  // namespace

std::vector<bfrun::command> bfrun::scan(std::string_view source) {
    std::vector<command> program;
    program.reserve(source.size());
    uint32_t line = 1;
    uint32_t column = 0;
    for (const char c : source) {
        const unsigned char ch = static_cast<unsigned char>(c);
        if (ch == '\n') {
            ++line;
            column = 0;
            continue;
        }
        if (isContinuationByte(ch)) continue;
        ++column;
        const OpEntry entry = charToOpcode[ch];
        if (entry.valid) program.push_back(command{line, column, entry.op});
    }
    program.shrink_to_fit();
    return program;
}
