#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

struct CommandOutput {
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;

    bool succeeded() const { return !timed_out && exit_code == 0; }
};

// Every external tool invocation goes through this interface.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // timeout_sec <= 0 waits without limit.
    virtual CommandOutput execute(const std::vector<std::string>& argv, int timeout_sec) = 0;
};

// fork/execvp with stdout and stderr captured through pipes. A child still
// running at the deadline is killed with SIGKILL and reported as timed out.
class SystemCommandRunner : public CommandRunner {
public:
    CommandOutput execute(const std::vector<std::string>& argv, int timeout_sec) override;
};

bool wait_for_process(pid_t pid, int timeout_sec, int& status);

std::string describe_command(const std::vector<std::string>& argv);

// Best diagnostic text of a failed command: stderr, else stdout, else the exit status.
std::string command_diagnostic(const CommandOutput& output);
