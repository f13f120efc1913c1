#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "bfrun/vm.hxx"
#include "helpers.hxx"

using bfrun::Cell;
using bfrun::Status;

namespace {
struct Expected {
    std::string output;
    Status status = Status::Ok;
    size_t cellPtr = 0;
    uint32_t line = 0;
    uint32_t column = 0;
    std::vector<Cell> cells;
};

// Straight-line reference for loop-free programs
Expected reference(const std::string& code, const std::string& input) {
    Expected e;
    e.cells.assign(BFRUN_TAPE_CELLS, 0);
    size_t in = 0;
    uint32_t line = 1, column = 0;
    for (char c : code) {
        if (c == '\n') {
            ++line;
            column = 0;
            continue;
        }
        ++column;
        Cell& cell = e.cells[e.cellPtr];
        if (c == '+') {
            cell = cell + 1;
        } else if (c == '-') {
            cell = cell - 1;
        } else if (c == '>' || c == '<') {
            if ((c == '<' && e.cellPtr == 0) || (c == '>' && e.cellPtr + 1 == BFRUN_TAPE_CELLS)) {
                e.status = Status::PointerOutOfBounds;
                e.line = line;
                e.column = column;
                return e;
            }
            if (c == '>')
                ++e.cellPtr;
            else
                --e.cellPtr;
        } else if (c == '.') {
            // Straight-line cells stay below 0x800 or wrap to near the maximum
            if (cell < 0x80) {
                e.output += static_cast<char>(cell);
            } else if (cell < 0x800) {
                e.output += static_cast<char>(0xC0 | (cell >> 6));
                e.output += static_cast<char>(0x80 | (cell & 0x3F));
            } else {
                e.output += "\xEF\xBF\xBD";
            }
        } else if (c == ',') {
            cell = in < input.size() ? static_cast<unsigned char>(input[in++]) : 0;
        }
    }
    return e;
}

std::string randomStraightProgram(std::mt19937& gen) {
    static const char ops[] = "+-<>.,\nx ";
    std::uniform_int_distribution<int> lenDist(0, 64);
    std::uniform_int_distribution<int> opDist(0, sizeof(ops) - 2);
    int len = lenDist(gen);
    std::string program;
    program.reserve(len);
    for (int i = 0; i < len; ++i) program += ops[opDist(gen)];
    return program;
}

// Every loop body ends in [-], so each loop runs at most once per entry
void randomLoopBody(std::mt19937& gen, std::string& out, int depth) {
    static const char ops[] = "+-<>>";
    std::uniform_int_distribution<int> lenDist(0, 6);
    std::uniform_int_distribution<int> opDist(0, sizeof(ops) - 2);
    std::uniform_int_distribution<int> nestDist(0, 3);
    int len = lenDist(gen);
    for (int i = 0; i < len; ++i) {
        if (depth < 6 && nestDist(gen) == 0) {
            out += '[';
            randomLoopBody(gen, out, depth + 1);
            out += "[-]]";
        } else {
            out += ops[opDist(gen)];
        }
    }
}

std::string randomInput(std::mt19937& gen) {
    std::uniform_int_distribution<int> lenDist(0, 8);
    std::uniform_int_distribution<int> byteDist(0, 127);
    int len = lenDist(gen);
    std::string input;
    input.reserve(len);
    for (int i = 0; i < len; ++i) input += static_cast<char>(byteDist(gen));
    return input;
}
}  // namespace

static void fuzz_straight_line(std::mt19937& gen) {
    for (int i = 0; i < 500; ++i) {
        std::string code = randomStraightProgram(gen);
        std::string input = randomInput(gen);
        Expected e = reference(code, input);
        bfrun::Machine m;
        Status ret;
        bfrun::Fault fault;
        std::string out = run(code, m, input, &ret, &fault);
        assert(ret == e.status);
        assert(out == e.output);
        assert(m.cellPtr == e.cellPtr);
        assert(m.cells == e.cells);
        if (ret != Status::Ok) {
            assert(fault.where.line == e.line);
            assert(fault.where.column == e.column);
        }
    }
}

static void fuzz_balanced_loops(std::mt19937& gen) {
    for (int i = 0; i < 500; ++i) {
        std::string code = "+";
        randomLoopBody(gen, code, 0);
        std::vector<size_t> jumps;
        const auto prog = bfrun::scan(code);
        assert(bfrun::resolveBrackets(prog, jumps) == Status::Ok);
        for (size_t j = 0; j < prog.size(); ++j) {
            if (prog[j].op == bfrun::cmdType::JMP_ZER) {
                assert(prog[jumps[j]].op == bfrun::cmdType::JMP_NOT_ZER);
                assert(jumps[jumps[j]] == j);
            }
        }
        bfrun::Machine first;
        bfrun::Machine second;
        Status ret;
        std::string a = run(code, first, "", &ret);
        assert(ret == Status::Ok || ret == Status::PointerOutOfBounds);
        std::string b = run(code, second, "");
        assert(hashOutput(a) == hashOutput(b));
        assert(first.cells == second.cells);
    }
}

int main() {
    std::mt19937 gen(123456u);
    fuzz_straight_line(gen);
    fuzz_balanced_loops(gen);
    return 0;
}
