#pragma once

#include <xxhash.h>

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include "bfrun/vm.hxx"

inline std::uint64_t hashOutput(std::string_view s) { return XXH64(s.data(), s.size(), 0); }

// Runs `code` on `machine` with std::cin/std::cout redirected, returns what the program printed.
inline std::string run(std::string_view code, bfrun::Machine& machine,
                       const std::string& input = "", bfrun::Status* retOut = nullptr,
                       bfrun::Fault* fault = nullptr, bool skipNewlines = false,
                       bfrun::ProfileInfo* profile = nullptr) {
    std::istringstream in(input);
    std::ostringstream out;
    auto* cinbuf = std::cin.rdbuf(in.rdbuf());
    auto* coutbuf = std::cout.rdbuf(out.rdbuf());
    std::cin.clear();
    bfrun::Status ret = bfrun::execute(machine, code, skipNewlines, profile, fault);
    if (retOut) *retOut = ret;
    std::cin.rdbuf(cinbuf);
    std::cout.rdbuf(coutbuf);
    std::cin.clear();
    return out.str();
}
