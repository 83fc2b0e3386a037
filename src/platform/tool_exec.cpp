#include "rro/tool_exec.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace rro {

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

} // namespace

std::string format_command(const std::string& executable,
                           const std::vector<std::string>& args) {
    std::string cmd = executable;
    for (const auto& arg : args) {
        cmd += ' ';
        bool needs_quotes = arg.find(' ') != std::string::npos ||
                            arg.find('\t') != std::string::npos;
        if (needs_quotes) cmd += '"';
        cmd += arg;
        if (needs_quotes) cmd += '"';
    }
    return cmd;
}

ToolResult ProcessToolInvoker::run(const std::string& executable,
                                   const std::vector<std::string>& args) {
    ToolResult result;

    spdlog::debug("exec: {}", format_command(executable, args));

    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable);
    argv_strings.insert(argv_strings.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    // Close-on-exec so children forked by other threads never hold the write end
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    pid_t pid = fork();

    if (pid == -1) {
        close(err_pipe[0]);
        close(err_pipe[1]);
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            close(devnull);
        }
        if (dup2(err_pipe[1], STDERR_FILENO) < 0) {
            _exit(127);
        }
        close(err_pipe[0]);
        close(err_pipe[1]);

        execv(executable.c_str(), argv.data());

        // If execv returns, it failed
        _exit(127);
    }

    // Parent process
    close(err_pipe[1]);

    std::string captured;
    char buffer[4096];
    for (;;) {
        ssize_t n = read(err_pipe[0], buffer, sizeof(buffer));
        if (n > 0) {
            captured.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    close(err_pipe[0]);

    int status;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    result.stderr_lines = split_lines(captured);
    spdlog::debug("exit {} ({} stderr lines)", result.exit_code, result.stderr_lines.size());

    return result;
}

} // namespace rro
