//
// Subprocess Execution
//
// Blocking execution of a child process with its output captured. Both
// streams are drained by reader threads while the parent waits, so a child
// writing a lot to either one cannot stall. Input, when given, is written by
// a third thread for the same reason.
//

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace svcgen::pipeline {

struct EnvVar {
    std::string key;
    std::string value;
};

struct ProcessOptions {
    std::vector<std::string> argv;                     ///< argv[0] is looked up in PATH
    std::vector<EnvVar> env;                           ///< Added to the inherited environment
    std::optional<std::filesystem::path> working_dir;
    bool merge_output = false;                         ///< stderr goes to stdout_text
    std::optional<std::string> input;                  ///< Fed to stdin; stdin is inherited when unset
};

struct ProcessResult {
    int exit_code = -1;
    bool started = false;      ///< false when the program could not be executed
    bool signaled = false;
    int signal = 0;
    std::string stdout_text;
    std::string stderr_text;
    std::string error;         ///< Why the process did not start or could not be waited for

    [[nodiscard]] bool success() const { return started && !signaled && exit_code == 0; }

    /// "exit status 2", "killed by signal 11", or error
    [[nodiscard]] std::string describe_status() const;
};

ProcessResult run_process(const ProcessOptions& options);

/// Shell-like rendering of argv for logs.
std::string format_command(const std::vector<std::string>& argv);

}  // namespace svcgen::pipeline
