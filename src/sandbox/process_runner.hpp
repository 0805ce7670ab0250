#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace runbox::sandbox {

// Reported as the exit code of a process that was killed at its deadline or
// never started.
inline constexpr int kSentinelExitCode = -1;

struct ResourceLimits {
    std::uint64_t cpu_seconds = 0;          // RLIMIT_CPU, 0 = unlimited
    std::uint64_t address_space_bytes = 0;  // RLIMIT_AS, 0 = unlimited
};

struct ExecSpec {
    // argv; a bare program name is resolved on PATH
    std::vector<std::string> command;
    std::filesystem::path working_dir;
    std::string stdin_text;
    std::chrono::milliseconds timeout{5000};
    std::size_t max_output_chars = 50000;  // UTF-8 code points per stream
    ResourceLimits limits;
};

struct ExecResult {
    int exit_code = kSentinelExitCode;
    int term_signal = 0;
    bool timed_out = false;
    bool spawn_failed = false;
    bool output_truncated = false;
    bool error_truncated = false;
    std::string output;
    std::string error;
    std::chrono::milliseconds duration{0};
};

class ProcessRunner {
public:
    // Runs one subprocess in its own process group. stdout and stderr are
    // drained while the process runs; output past max_output_chars is read
    // and dropped. At the deadline the whole group is killed with SIGKILL.
    static ExecResult Run(const ExecSpec& spec);
};

}  // namespace runbox::sandbox
