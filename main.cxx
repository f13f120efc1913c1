/*
    Bfrun - A bounds-checked brainfuck interpreter
    Main standalone file
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "bfrun/diagnostics.hxx"
#include "bfrun/source.hxx"
#include "bfrun/vm.hxx"
#ifdef BFRUN_ENABLE_REPL
#include "bfrun/repl.hxx"
#include "cpp-terminal/color.hpp"
#include "cpp-terminal/style.hpp"
#endif

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define STDERR_FILENO 2
#else
#include <unistd.h>
#endif

namespace {
struct CmdArgs {
    std::string filename;
    std::string evalCode;
    bool hasEval = false;
    bool dumpMemory = false;
    bool help = false;
    bool bad = false;
    bool skipNewlines = BFRUN_DEFAULT_SKIP_NEWLINES;
    bool profile = false;
};

CmdArgs parseArgs(int argc, char* argv[]) {
    CmdArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-e" && i + 1 < argc) {
            args.evalCode = argv[++i];
            args.hasEval = true;
            args.filename.clear();
        } else if (arg == "-i" && i + 1 < argc) {
            ++i;
            if (!args.hasEval) args.filename = argv[i];
        } else if (arg == "-dm") {
            args.dumpMemory = true;
        } else if (arg == "-h") {
            args.help = true;
        } else if (arg == "-nl") {
            args.skipNewlines = true;
        } else if (arg == "--profile") {
            args.profile = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            args.bad = true;
        } else if (args.hasEval) {
            continue;
        } else if (args.filename.empty()) {
            args.filename = std::string(arg);
        } else {
            std::cerr << "Only one source file may be given" << std::endl;
            args.bad = true;
        }
    }
    return args;
}

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " [options] <file>\n"
              << "Options:\n"
              << "  -e <code>        Execute Brainfuck code directly\n"
              << "  -i <file>        Execute code from file\n"
              << "  -dm              Dump memory after program\n"
              << "  -nl              Skip newlines when reading input\n"
              << "  --profile        Print execution profile\n"
              << "  -h               Show this help message" << std::endl;
}

void printError(std::string_view msg) {
#ifdef BFRUN_ENABLE_REPL
    if (isatty(STDERR_FILENO)) {
        std::cerr << Term::color_fg(Term::Color::Name::Red)
                  << "ERROR:" << Term::color_fg(Term::Color::Name::Default) << ' ' << msg
                  << std::endl;
        return;
    }
#endif
    std::cerr << "ERROR: " << msg << std::endl;
}

#ifndef BFRUN_ENABLE_REPL
void dumpMemory(const bfrun::Machine& machine) {
    const auto& cells = machine.cells;
    const size_t cellPtr = machine.cellPtr;
    size_t lastNonEmpty = cells.size() - 1;
    while (lastNonEmpty > cellPtr && lastNonEmpty > 0 && !cells[lastNonEmpty]) {
        --lastNonEmpty;
    }
    std::cout << "Memory dump:" << std::endl;
    for (size_t i = 0; i <= lastNonEmpty; ++i) {
        if (i == cellPtr) std::cout << '[';
        std::cout << cells[i];
        if (i == cellPtr) std::cout << ']';
        std::cout << (i % 10 == 9 ? '\n' : ' ');
    }
    if (lastNonEmpty % 10 != 9) std::cout << std::endl;
}
#endif
}  // namespace

int main(int argc, char* argv[]) {
    CmdArgs opts = parseArgs(argc, argv);
    if (opts.help) {
        printHelp(argv[0]);
        return 0;
    }
    if (opts.bad) {
        printHelp(argv[0]);
        return 1;
    }
    bfrun::Machine machine;
    if (opts.filename.empty() && !opts.hasEval) {
#ifdef BFRUN_ENABLE_REPL
        bfrun::ReplConfig cfg{opts.skipNewlines, true, false, 0};
        return bfrun::runRepl(machine, cfg);
#else
        std::cerr << "Usage: " << argv[0] << " [options] <file>" << std::endl;
        return 1;
#endif
    }

    std::string code;
    if (opts.hasEval) {
        code = opts.evalCode;
    } else {
        std::string err;
        if (!bfrun::readSource(opts.filename, code, err)) {
            printError(err);
            return 1;
        }
    }

    bfrun::ProfileInfo prof;
    bfrun::ProfileInfo* profPtr = opts.profile ? &prof : nullptr;
    bfrun::Fault fault;
    const bfrun::Status ret = bfrun::execute(machine, code, opts.skipNewlines, profPtr, &fault);
    if (ret != bfrun::Status::Ok) bfrun::reportFault(fault, std::cerr, isatty(STDERR_FILENO) != 0);
    if (opts.dumpMemory) dumpMemory(machine);
    if (opts.profile) {
        std::cout << "Instructions executed: " << prof.instructions << std::endl;
        std::cout << "Loop iterations: " << prof.loopIterations << std::endl;
        std::cout << "Elapsed time: " << prof.seconds << "s" << std::endl;
    }
    return bfrun::exitCode(ret);
}
