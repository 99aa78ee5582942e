#include <svcgen/pipeline/process.hh>

#include <cerrno>
#include <cstring>
#include <functional>
#include <thread>

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace svcgen::pipeline {

namespace {

void read_fd(int fd, std::string& out) {
    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(fd);
}

/// Write all of data to fd, then close it. A child that exits without
/// reading everything ends the write with EPIPE; SIGPIPE is blocked on this
/// thread so it cannot terminate the process.
void write_fd(int fd, const std::string& data) {
    sigset_t pipe_signal;
    sigemptyset(&pipe_signal);
    sigaddset(&pipe_signal, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_signal, nullptr);

    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(fd);
}

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

std::string errno_text(int err) {
    return std::strerror(err);
}

}  // namespace

std::string ProcessResult::describe_status() const {
    if (!started) {
        return error.empty() ? "not started" : error;
    }
    if (signaled) {
        return "killed by signal " + std::to_string(signal);
    }
    return "exit status " + std::to_string(exit_code);
}

std::string format_command(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        if (arg.empty() || arg.find_first_of(" \t\"'\\$") != std::string::npos) {
            line += '\'';
            for (char c : arg) {
                if (c == '\'') {
                    line += "'\\''";
                } else {
                    line += c;
                }
            }
            line += '\'';
        } else {
            line += arg;
        }
    }
    return line;
}

ProcessResult run_process(const ProcessOptions& options) {
    ProcessResult result;
    if (options.argv.empty()) {
        result.error = "empty command line";
        return result;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int stdin_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // reports exec failure; closed by a successful exec

    if (options.input && pipe(stdin_pipe) != 0) {
        result.error = "pipe stdin failed: " + errno_text(errno);
        return result;
    }
    if (pipe(stdout_pipe) != 0) {
        result.error = "pipe stdout failed: " + errno_text(errno);
        close_pair(stdin_pipe);
        return result;
    }
    if (!options.merge_output && pipe(stderr_pipe) != 0) {
        result.error = "pipe stderr failed: " + errno_text(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        return result;
    }
    if (pipe(exec_pipe) != 0 || fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC) != 0) {
        result.error = "pipe exec failed: " + errno_text(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return result;
    }

    // Prepared before fork; the child only calls async-signal-safe functions
    // apart from setenv.
    std::vector<char*> argv_c;
    argv_c.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        argv_c.push_back(const_cast<char*>(arg.c_str()));
    }
    argv_c.push_back(nullptr);
    const std::string working_dir = options.working_dir ? options.working_dir->string() : std::string();

    const pid_t pid = fork();
    if (pid < 0) {
        result.error = "fork failed: " + errno_text(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return result;
    }

    if (pid == 0) {
        if (stdin_pipe[0] >= 0) {
            dup2(stdin_pipe[0], STDIN_FILENO);
        }
        close_pair(stdin_pipe);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(options.merge_output ? stdout_pipe[1] : stderr_pipe[1], STDERR_FILENO);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close(exec_pipe[0]);

        int err = 0;
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            err = errno;
        } else {
            for (const auto& env : options.env) {
                setenv(env.key.c_str(), env.value.c_str(), 1);
            }
            execvp(argv_c[0], argv_c.data());
            err = errno;
        }
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(stdout_pipe[1]);
    if (stderr_pipe[1] >= 0) {
        close(stderr_pipe[1]);
    }
    close(exec_pipe[1]);

    std::thread stdin_thread;
    if (stdin_pipe[1] >= 0) {
        close(stdin_pipe[0]);
        stdin_thread = std::thread(write_fd, stdin_pipe[1], std::cref(*options.input));
    }
    std::thread stdout_thread(read_fd, stdout_pipe[0], std::ref(result.stdout_text));
    std::thread stderr_thread;
    if (!options.merge_output) {
        stderr_thread = std::thread(read_fd, stderr_pipe[0], std::ref(result.stderr_text));
    }

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    int status = 0;
    while (true) {
        const pid_t waited = waitpid(pid, &status, 0);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno == EINTR) {
            continue;
        }
        result.error = "waitpid failed: " + errno_text(errno);
        break;
    }

    if (stdin_thread.joinable()) {
        stdin_thread.join();
    }
    stdout_thread.join();
    if (stderr_thread.joinable()) {
        stderr_thread.join();
    }

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.error = "cannot execute " + options.argv.front() + ": " + errno_text(exec_errno);
        return result;
    }
    if (!result.error.empty()) {
        return result;
    }

    result.started = true;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
    }
    return result;
}

}  // namespace svcgen::pipeline
