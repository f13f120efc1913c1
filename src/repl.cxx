/*
    Bfrun - A bounds-checked brainfuck interpreter
    Line-based REPL using linenoise-ng
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#ifdef BFRUN_ENABLE_REPL
#include "bfrun/repl.hxx"

#include <linenoise.h>
#include <simde/x86/avx2.h>
#include <simde/x86/sse2.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "bfrun/diagnostics.hxx"

namespace {
constexpr int historyLen = 100;
}  // namespace

void bfrun::diffCells(const std::vector<Cell>& prev, const std::vector<Cell>& curr,
                      std::vector<size_t>& changed) {
    changed.clear();
    const size_t limit = std::min(prev.size(), curr.size());
#if defined(SIMDE_X86_AVX2_NATIVE) || (SIMDE_NATURAL_VECTOR_SIZE >= 256)
    constexpr size_t lanes = 8;
#else
    constexpr size_t lanes = 4;
#endif
    const size_t vecEnd = (limit / lanes) * lanes;
    for (size_t i = 0; i < vecEnd; i += lanes) {
#if defined(SIMDE_X86_AVX2_NATIVE) || (SIMDE_NATURAL_VECTOR_SIZE >= 256)
        auto a = simde_mm256_loadu_si256(reinterpret_cast<const simde__m256i*>(curr.data() + i));
        auto b = simde_mm256_loadu_si256(reinterpret_cast<const simde__m256i*>(prev.data() + i));
        auto eq = simde_mm256_cmpeq_epi32(a, b);
        uint32_t mask = static_cast<uint32_t>(simde_mm256_movemask_ps(simde_mm256_castsi256_ps(eq)));
        constexpr uint32_t allEqual = 0xFFu;
#else
        auto a = simde_mm_loadu_si128(reinterpret_cast<const simde__m128i*>(curr.data() + i));
        auto b = simde_mm_loadu_si128(reinterpret_cast<const simde__m128i*>(prev.data() + i));
        auto eq = simde_mm_cmpeq_epi32(a, b);
        uint32_t mask = static_cast<uint32_t>(simde_mm_movemask_ps(simde_mm_castsi128_ps(eq)));
        constexpr uint32_t allEqual = 0xFu;
#endif
        if (mask != allEqual) {
            for (size_t j = 0; j < lanes; ++j) {
                if (!((mask >> j) & 1u)) changed.push_back(i + j);
            }
        }
    }
    for (size_t i = vecEnd; i < limit; ++i) {
        if (curr[i] != prev[i]) changed.push_back(i);
    }
}

int bfrun::runRepl(Machine& machine, ReplConfig& cfg) {
    linenoiseHistorySetMaxLen(historyLen);
    std::vector<Cell> prevCells;
    std::vector<size_t> changed;
    while (true) {
        char* line = linenoise("$ ");
        if (line == nullptr) {
            std::cout << std::endl;
            break;  // Ctrl-D or Ctrl-C
        }
        std::string input(line);
        linenoiseHistoryAdd(line);
        std::free(line);
        if (input.empty()) continue;
        if (input[0] == ':') {
            std::istringstream iss(input.substr(1));
            std::string cmd;
            iss >> cmd;
            if (cmd == "q" || cmd == "quit") {
                break;
            } else if (cmd == "dump") {
                dumpMemory(machine, std::cout, &changed, cfg.highlightChanges, cfg.searchActive,
                           cfg.searchValue);
            } else if (cmd == "help") {
                std::cout << "Commands:\n"
                          << ":dump              show memory\n"
                          << ":nl on|off        skip newlines on input\n"
                          << ":highlight on|off highlight changed cells\n"
                          << ":search off|VAL   highlight cells equal to VAL\n"
                          << ":reset            clear memory and pointer\n"
                          << ":q                quit" << std::endl;
            } else if (cmd == "nl") {
                std::string val;
                iss >> val;
                if (val == "on")
                    cfg.skipNewlines = true;
                else if (val == "off")
                    cfg.skipNewlines = false;
            } else if (cmd == "highlight") {
                std::string val;
                iss >> val;
                if (val == "on")
                    cfg.highlightChanges = true;
                else if (val == "off") {
                    cfg.highlightChanges = false;
                    changed.clear();
                }
            } else if (cmd == "search") {
                std::string val;
                if (!(iss >> val) || val == "off") {
                    cfg.searchActive = false;
                } else {
                    char* end = nullptr;
                    unsigned long long parsed = std::strtoull(val.c_str(), &end, 10);
                    if (val[0] == '-' || end == val.c_str() || *end != '\0') {
                        std::cout << "Invalid search value" << std::endl;
                        cfg.searchActive = false;
                    } else {
                        cfg.searchValue = parsed;
                        cfg.searchActive = true;
                    }
                }
            } else if (cmd == "reset") {
                machine.reset();
                changed.clear();
            } else {
                std::cout << "Unknown command" << std::endl;
            }
            continue;
        }
        if (cfg.highlightChanges) prevCells = machine.cells;
        Fault fault;
        Status ret = execute(machine, input, cfg.skipNewlines, nullptr, &fault);
        if (ret != Status::Ok) reportFault(fault, std::cout, true);
        if (cfg.highlightChanges) diffCells(prevCells, machine.cells, changed);
    }
    return 0;
}
#endif  // BFRUN_ENABLE_REPL
