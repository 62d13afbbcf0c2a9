#include "command_runner.hpp"
#include <array>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <sys/wait.h>

std::string ShellCommandRunner::quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

CommandResult ShellCommandRunner::run(const std::vector<std::string>& args,
                                      std::chrono::seconds timeout) const {
    if (args.empty()) {
        throw std::runtime_error("Empty command");
    }

    std::string command = "timeout --kill-after=1 " + std::to_string(timeout.count());
    for (const auto& arg : args) {
        command += " " + quote(arg);
    }
    // Only stdout is parsed; git diagnostics stay out of the result
    command += " 2>/dev/null";

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command.c_str(), "r"), pclose);
    if (!pipe) {
        throw std::runtime_error("Failed to execute command: " + command);
    }

    CommandResult result;
    std::array<char, 256> buffer;
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe.release());
    if (status == -1) {
        throw std::runtime_error("Failed to wait for command: " + command);
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        result.exitCode = -1;
    }
    result.timedOut = result.exitCode == TIMEOUT_EXIT_CODE || result.exitCode == KILLED_EXIT_CODE;

    return result;
}
