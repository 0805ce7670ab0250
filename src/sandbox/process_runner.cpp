#include "sandbox/process_runner.hpp"

#include <array>
#include <cerrno>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>
#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/process_compat.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::sandbox {
namespace asio = boost::asio;

namespace {

constexpr long kMaxScannedDescriptor = 65536;

// Keeps the first `limit` UTF-8 code points of a stream. The cut always lands
// on a code point boundary; bytes that are not valid UTF-8 count one each.
struct StreamCapture {
    explicit StreamCapture(std::size_t limit) : limit(limit) {}

    void Append(const char* bytes, std::size_t size) {
        if (truncated) {
            return;
        }
        for (std::size_t i = 0; i < size; ++i) {
            const auto byte = static_cast<unsigned char>(bytes[i]);
            // continuation bytes are 10xxxxxx
            if ((byte & 0xC0) != 0x80) {
                if (chars == limit) {
                    truncated = true;
                    return;
                }
                ++chars;
            }
            data.push_back(bytes[i]);
        }
    }

    std::size_t limit;
    std::size_t chars = 0;
    std::string data;
    bool truncated = false;
    std::array<char, 8192> chunk{};
};

// Reads until EOF. Bytes past the cap are still consumed so the child never
// blocks on a full pipe.
void Drain(bp::async_pipe& pipe, StreamCapture& capture, const std::function<void()>& on_closed) {
    pipe.async_read_some(
        asio::buffer(capture.chunk),
        [&pipe, &capture, &on_closed](const boost::system::error_code& ec, std::size_t size) {
            if (size > 0) {
                capture.Append(capture.chunk.data(), size);
            }
            if (ec) {
                on_closed();
                return;
            }
            Drain(pipe, capture, on_closed);
        });
}

// True once the process has terminated; leaves it waitable.
bool HasExited(pid_t pid) {
    siginfo_t info{};
    if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        return true;
    }
    return info.si_pid == pid;
}

void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

// Runs in the forked child. Descriptors another thread opened without
// O_CLOEXEC (pipes of a concurrent run) must not survive the exec.
void MarkInheritedDescriptorsCloexec() {
    if (::close_range(3, ~0U, CLOSE_RANGE_CLOEXEC) == 0) {
        return;
    }
    long max_fd = ::sysconf(_SC_OPEN_MAX);
    if (max_fd <= 0 || max_fd > kMaxScannedDescriptor) {
        max_fd = kMaxScannedDescriptor;
    }
    for (int fd = 3; fd < max_fd; ++fd) {
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
}

}  // namespace

ExecResult ProcessRunner::Run(const ExecSpec& spec) {
    ExecResult result{};
    const auto started = std::chrono::steady_clock::now();
    if (spec.command.empty()) {
        result.spawn_failed = true;
        result.error = "empty command";
        return result;
    }
    IgnoreSigpipe();

    std::string executable = spec.command.front();
    if (executable.find('/') == std::string::npos) {
        const auto resolved = bp::search_path(executable);
        if (resolved.empty()) {
            result.spawn_failed = true;
            result.error = "program not found: " + executable;
            return result;
        }
        executable = resolved.string();
    }
    const std::vector<std::string> args(spec.command.begin() + 1, spec.command.end());
    const ResourceLimits limits = spec.limits;

    asio::io_context ios;
    bp::async_pipe out_pipe(ios);
    bp::async_pipe err_pipe(ios);
    bp::async_pipe in_pipe(ios);
    bp::group group;
    bp::child child;
    try {
        child = bp::child(
            bp::exe = executable,
            bp::args = args,
            bp::start_dir = spec.working_dir.string(),
            bp::std_out > out_pipe,
            bp::std_err > err_pipe,
            bp::std_in < in_pipe,
            group,
            bp::extend::on_exec_setup = [limits](auto&) {
                // SIG_IGN would otherwise survive the exec.
                ::signal(SIGPIPE, SIG_DFL);
                MarkInheritedDescriptorsCloexec();
                if (limits.cpu_seconds > 0) {
                    const rlimit cpu{static_cast<rlim_t>(limits.cpu_seconds),
                                     static_cast<rlim_t>(limits.cpu_seconds)};
                    ::setrlimit(RLIMIT_CPU, &cpu);
                }
                if (limits.address_space_bytes > 0) {
                    const rlimit as{static_cast<rlim_t>(limits.address_space_bytes),
                                    static_cast<rlim_t>(limits.address_space_bytes)};
                    ::setrlimit(RLIMIT_AS, &as);
                }
            });
    } catch (const bp::process_error& ex) {
        result.spawn_failed = true;
        result.error = std::string("exec failed: ") + ex.what();
        utils::LogError("runner", "spawn failed", {{"program", executable}, {"error", ex.what()}});
        return result;
    }

    const pid_t pid = child.id();
    const auto deadline = started + spec.timeout;
    utils::LogDebug("runner", "spawned", {
        {"pid", std::to_string(pid)},
        {"command", utils::Join(spec.command, " ")}});

    StreamCapture out_capture(spec.max_output_chars);
    StreamCapture err_capture(spec.max_output_chars);
    asio::steady_timer deadline_timer(ios, deadline);

    int open_streams = 2;
    // Once both output streams are gone a stdin write still pending would
    // keep the loop alive past the deadline, so it is dropped as well.
    const std::function<void()> on_stream_closed = [&open_streams, &deadline_timer, &in_pipe]() {
        if (--open_streams == 0) {
            boost::system::error_code ec;
            in_pipe.close(ec);
            deadline_timer.cancel();
        }
    };
    Drain(out_pipe, out_capture, on_stream_closed);
    Drain(err_pipe, err_capture, on_stream_closed);

    boost::system::error_code close_ec;
    if (spec.stdin_text.empty()) {
        in_pipe.close(close_ec);
    } else {
        // A child that exits without reading makes this fail with EPIPE.
        asio::async_write(
            in_pipe,
            asio::buffer(spec.stdin_text),
            [&in_pipe](const boost::system::error_code&, std::size_t) {
                boost::system::error_code ec;
                in_pipe.close(ec);
            });
    }

    deadline_timer.async_wait([&](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (!HasExited(pid)) {
            result.timed_out = true;
        }
        // Also reclaims descendants that still hold the pipes open.
        std::error_code kill_ec;
        if (group.valid()) {
            group.terminate(kill_ec);
        }
        // A descendant that left the group may still hold the write ends.
        boost::system::error_code pipe_ec;
        out_pipe.close(pipe_ec);
        err_pipe.close(pipe_ec);
        in_pipe.close(pipe_ec);
    });

    ios.run();

    // Both streams are closed but the process may have closed them early.
    while (!result.timed_out && !HasExited(pid)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    std::error_code kill_ec;
    if (group.valid()) {
        group.terminate(kill_ec);
    }
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    // Reaped here, so the child handle must not wait on the pid again.
    child.detach();

    if (result.timed_out) {
        result.exit_code = kSentinelExitCode;
        if (WIFSIGNALED(status)) {
            result.term_signal = WTERMSIG(status);
        }
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }

    result.output = std::move(out_capture.data);
    result.error = std::move(err_capture.data);
    result.output_truncated = out_capture.truncated;
    result.error_truncated = err_capture.truncated;
    result.duration = std::chrono::milliseconds(utils::ElapsedMs(started));

    utils::LogDebug("runner", "finished", {
        {"pid", std::to_string(pid)},
        {"exit", std::to_string(result.exit_code)},
        {"timeout", result.timed_out ? "true" : "false"},
        {"duration_ms", std::to_string(result.duration.count())}});
    return result;
}

}  // namespace runbox::sandbox
