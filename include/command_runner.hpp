#pragma once

#include <string>
#include <vector>
#include <chrono>

struct CommandResult {
    std::string output;     // Captured stdout
    int exitCode = -1;
    bool timedOut = false;

    bool succeeded() const { return !timedOut && exitCode == 0; }
};

// Runs external programs. Implementations never change the process working directory;
// callers pass any target path as an argument (e.g. `git -C <path>`).
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Run `args[0]` with the remaining arguments and wait at most `timeout`.
    // Throws std::runtime_error only when the process cannot be started.
    virtual CommandResult run(const std::vector<std::string>& args,
                              std::chrono::seconds timeout) const = 0;
};

// popen-based runner; the deadline is enforced by coreutils `timeout`
class ShellCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& args,
                      std::chrono::seconds timeout) const override;

    // Quote a single argument for /bin/sh
    static std::string quote(const std::string& arg);

private:
    // Exit status used by `timeout` when the deadline expires
    static constexpr int TIMEOUT_EXIT_CODE = 124;
    static constexpr int KILLED_EXIT_CODE = 137;
};
