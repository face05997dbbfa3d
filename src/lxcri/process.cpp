#include "lxcri/process.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

#include "lxcri/errors.h"
#include "lxcri/filesystem.h"
#include "lxcri/options.h"

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

[[noreturn]] void exec_child(const std::vector<std::string>& argv, int out_fd, int err_fd) {
    dup2(out_fd, STDOUT_FILENO);
    dup2(err_fd, STDERR_FILENO);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        close(devnull);
    }
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);
    execvp(args[0], args.data());
    std::string message = "exec " + argv[0] + ": " + std::strerror(errno) + "\n";
    ssize_t ignored = write(STDERR_FILENO, message.data(), message.size());
    (void)ignored;
    _exit(127);
}

} // namespace

bool wait_for_process(pid_t pid, int timeout_sec, int& status) {
    if (timeout_sec <= 0) {
        while (true) {
            pid_t result = waitpid(pid, &status, 0);
            if (result == pid) {
                return true;
            }
            if (result == -1 && errno == EINTR) {
                continue;
            }
            return false;
        }
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_sec);
    while (true) {
        pid_t result = waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            return true;
        }
        if (result == -1) {
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            errno = ETIMEDOUT;
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

CommandOutput SystemCommandRunner::execute(const std::vector<std::string>& argv, int timeout_sec) {
    if (argv.empty() || argv[0].empty()) {
        throw RuntimeError(ErrorCode::InvalidArgument, "Cannot execute an empty command");
    }
    log_debug("Executing: " + describe_command(argv));

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw RuntimeError(ErrorCode::OperationFailed, std::string("pipe: ") + std::strerror(errno));
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        throw RuntimeError(ErrorCode::OperationFailed, std::string("pipe: ") + std::strerror(saved));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        throw RuntimeError(ErrorCode::OperationFailed, std::string("fork: ") + std::strerror(saved));
    }
    if (pid == 0) {
        exec_child(argv, out_pipe[1], err_pipe[1]);
    }
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    CommandOutput output;
    std::string* sinks[2] = {&output.stdout_output, &output.stderr_output};
    pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    int open_fds = 2;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_sec);

    while (open_fds > 0) {
        int wait_ms = -1;
        if (timeout_sec > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                output.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining.count());
        }
        int rc = poll(fds, 2, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            log_warning(std::string("poll failed: ") + std::strerror(errno));
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            char buffer[4096];
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }
    for (auto& pfd : fds) {
        close_fd(pfd.fd);
    }

    if (output.timed_out) {
        kill(pid, SIGKILL);
    }

    int wait_sec = 0;
    if (timeout_sec > 0 && !output.timed_out) {
        auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
                deadline - std::chrono::steady_clock::now());
        wait_sec = std::max<int>(1, static_cast<int>(remaining.count()));
    }
    int status = 0;
    if (!wait_for_process(pid, wait_sec, status)) {
        if (errno != ETIMEDOUT) {
            throw RuntimeError(ErrorCode::OperationFailed,
                               "waitpid failed for " + argv[0] + ": " + std::strerror(errno));
        }
        output.timed_out = true;
    }

    if (output.timed_out) {
        output.exit_code = -1;
        log_warning("Command timed out after " + std::to_string(timeout_sec) + "s: " + describe_command(argv));
    } else if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.exit_code = 128 + WTERMSIG(status);
    }
    return output;
}

std::string describe_command(const std::vector<std::string>& argv) {
    return join_strings(argv, " ");
}

std::string command_diagnostic(const CommandOutput& output) {
    if (output.timed_out) {
        return "command timed out";
    }
    std::string text = trim(output.stderr_output);
    if (text.empty()) {
        text = trim(output.stdout_output);
    }
    if (text.empty()) {
        text = "exit code " + std::to_string(output.exit_code);
    }
    return text;
}
