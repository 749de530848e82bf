#include "process.h"
#include "constants.h"

#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace sandpool {

namespace {

using SteadyTime = std::chrono::steady_clock;

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Close-on-exec pipe that closes whatever ends are still open
struct Pipe {
    int read_end = -1;
    int write_end = -1;

    Pipe() {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) == -1) {
            throw std::runtime_error(std::string("Failed to create pipe: ") + strerror(errno));
        }
        read_end = fds[0];
        write_end = fds[1];
    }

    ~Pipe() {
        close_fd(read_end);
        close_fd(write_end);
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
};

int remaining_ms(SteadyTime::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SteadyTime::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

void kill_group(pid_t pid) {
    // The child moves itself into its own group; it may not have done so yet
    if (kill(-pid, SIGKILL) != 0) {
        kill(pid, SIGKILL);
    }
}

void reap(pid_t pid, int& status) {
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace

ProcessResult Process::run(const std::vector<std::string>& argv,
                           const std::string& stdin_data,
                           std::chrono::milliseconds timeout,
                           const ChunkSink& on_output) {
    if (argv.empty()) {
        throw std::invalid_argument("Process::run called with an empty command");
    }

    // A child that exits before reading stdin must not kill us with SIGPIPE
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });

    ProcessResult result;
    Pipe in_pipe;
    Pipe out_pipe;
    Pipe exec_error_pipe;

    // Build argv before fork; the child must not allocate
    std::vector<char*> c_argv;
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    auto deadline = SteadyTime::now() + timeout;

    pid_t pid = fork();
    if (pid == -1) {
        throw std::runtime_error(std::string("Failed to fork process: ") + strerror(errno));
    }

    if (pid == 0) {
        setpgid(0, 0);
        dup2(in_pipe.read_end, STDIN_FILENO);
        dup2(out_pipe.write_end, STDOUT_FILENO);
        dup2(out_pipe.write_end, STDERR_FILENO);

        execvp(c_argv[0], c_argv.data());

        int err = errno;
        ssize_t ignored = write(exec_error_pipe.write_end, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close_fd(in_pipe.read_end);
    close_fd(out_pipe.write_end);
    close_fd(exec_error_pipe.write_end);

    // Reads 0 bytes once execvp succeeds and the close-on-exec end goes away
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_error_pipe.read_end, &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        reap(pid, status);
        result.spawn_failed = true;
        result.output = "Failed to execute " + argv[0] + ": " + strerror(exec_errno);
        return result;
    }

    if (stdin_data.empty()) {
        close_fd(in_pipe.write_end);
    } else {
        fcntl(in_pipe.write_end, F_SETFL, fcntl(in_pipe.write_end, F_GETFL) | O_NONBLOCK);
    }

    int status = 0;
    try {
        size_t written = 0;
        bool output_open = true;
        char buffer[PIPE_BUFFER_SIZE];

        while (output_open) {
            int wait_ms = remaining_ms(deadline);
            if (wait_ms == 0) {
                kill_group(pid);
                result.timed_out = true;
                break;
            }

            struct pollfd fds[2];
            nfds_t nfds = 1;
            fds[0] = {out_pipe.read_end, POLLIN, 0};
            if (in_pipe.write_end >= 0) {
                fds[1] = {in_pipe.write_end, POLLOUT, 0};
                nfds = 2;
            }

            int rc = poll(fds, nfds, wait_ms);
            if (rc < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error(std::string("poll failed: ") + strerror(errno));
            }
            if (rc == 0) continue;

            if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                ssize_t bytes_read = read(out_pipe.read_end, buffer, sizeof(buffer));
                if (bytes_read > 0) {
                    std::string chunk(buffer, bytes_read);
                    if (result.output.size() < MAX_OUTPUT_SIZE) {
                        result.output.append(chunk, 0, MAX_OUTPUT_SIZE - result.output.size());
                    }
                    if (on_output) on_output(chunk);
                } else if (bytes_read == 0 || (errno != EINTR && errno != EAGAIN)) {
                    output_open = false;
                }
            }

            if (nfds == 2 && fds[1].revents != 0) {
                if (fds[1].revents & (POLLERR | POLLHUP)) {
                    close_fd(in_pipe.write_end);
                } else {
                    ssize_t w = write(in_pipe.write_end, stdin_data.data() + written,
                                      stdin_data.size() - written);
                    if (w > 0) {
                        written += static_cast<size_t>(w);
                    } else if (errno != EAGAIN && errno != EINTR) {
                        close_fd(in_pipe.write_end);
                    }
                    if (written == stdin_data.size()) {
                        close_fd(in_pipe.write_end);
                    }
                }
            }
        }

        close_fd(in_pipe.write_end);

        // Output closed; the child may still be running
        while (true) {
            pid_t w = waitpid(pid, &status, result.timed_out ? 0 : WNOHANG);
            if (w == pid) break;
            if (w < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error(std::string("waitpid failed: ") + strerror(errno));
            }
            if (remaining_ms(deadline) == 0) {
                kill_group(pid);
                result.timed_out = true;
                continue;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    } catch (...) {
        kill_group(pid);
        reap(pid, status);
        throw;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }

    return result;
}

} // namespace sandpool
