#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace sandpool {

// Receives output as it is read from the child
using ChunkSink = std::function<void(const std::string& chunk)>;

struct ProcessResult {
    int exit_code = -1;         // Valid when the child exited normally
    int term_signal = 0;        // Non-zero when the child was killed by a signal
    bool timed_out = false;     // Killed by us after the deadline
    bool spawn_failed = false;  // execvp() could not start the binary
    std::string output;         // stdout and stderr interleaved, capped at MAX_OUTPUT_SIZE

    bool exited_cleanly() const { return !spawn_failed && !timed_out && term_signal == 0; }
};

// Runs a command with stdin fed from a buffer and stdout/stderr merged
// into one pipe. The child gets its own process group; on timeout the
// whole group is SIGKILLed.
class Process {
public:
    static ProcessResult run(const std::vector<std::string>& argv,
                             const std::string& stdin_data,
                             std::chrono::milliseconds timeout,
                             const ChunkSink& on_output = nullptr);
};

} // namespace sandpool
