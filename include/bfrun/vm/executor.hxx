#pragma once

#include <string_view>
#include <vector>

namespace bfrun {
struct command;
struct Fault;
struct Machine;
struct ProfileInfo;
enum class Status : int;

/// @brief Pairs every bracket of `program` with its partner.
/// @param jumps Resized to program.size(); for a bracket index it holds the partner's index,
/// other entries are left at 0.
/// @param fault Optional, receives the offending bracket on failure.
/// @return Ok, UnmatchedLoopEnd or UnmatchedLoopStart. A stray `]` is reported as soon as it is
/// reached, a `[` left open is reported (the earliest one) once the whole sequence has been read.
Status resolveBrackets(const std::vector<command>& program, std::vector<size_t>& jumps,
                       Fault* fault = nullptr);

/// @brief Runs a scanned program on `machine`. Output goes to std::cout (flushed after every
/// `.`), input comes from std::cin.
/// @param machine Tape and pointer to run on. Left as it was when the run stopped, so a failed
/// run can still be inspected.
/// @param program Command sequence from scan().
/// @param skipNewlines Discard `\n` bytes on input. Check BFRUN_DEFAULT_SKIP_NEWLINES.
/// On end of input the current cell is set to 0.
/// @param profile Optional execution counters.
/// @param fault Optional, receives the failing command.
/// @return Status::Ok or the first error met. Bracket errors are found before anything runs.
/// ExcessiveLoopDepth is raised by the `[` that would enter loop BFRUN_MAX_LOOP_DEPTH + 1; a
/// skipped loop is never open.
Status execute(Machine& machine, const std::vector<command>& program,
               bool skipNewlines = BFRUN_DEFAULT_SKIP_NEWLINES, ProfileInfo* profile = nullptr,
               Fault* fault = nullptr);

// Scans then executes.
Status execute(Machine& machine, std::string_view source,
               bool skipNewlines = BFRUN_DEFAULT_SKIP_NEWLINES, ProfileInfo* profile = nullptr,
               Fault* fault = nullptr);
}  // namespace bfrun
