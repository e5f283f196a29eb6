#include "interpreter.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace {

constexpr int EXEC_FAILED = 127;

// Runs "<interpreter> args..." and returns its exit status. When output is
// given, the child's stdout is captured into it.
int run_interpreter(const std::string& interpreter, std::vector<std::string> args, std::string* output) {
    args.insert(args.begin(), interpreter);
    std::vector<char*> c_args;
    for (auto& arg : args) c_args.push_back(arg.data());
    c_args.push_back(nullptr);

    int fds[2] = {-1, -1};
    if (output && pipe(fds) == -1) {
        throw FnpackException(string_format("error.pipe_failed", strerror(errno)));
    }

    pid_t pid = fork();
    if (pid == -1) {
        if (output) {
            close(fds[0]);
            close(fds[1]);
        }
        throw FnpackException(string_format("error.fork_failed", strerror(errno)));
    }
    if (pid == 0) {
        if (output) {
            dup2(fds[1], STDOUT_FILENO);
            close(fds[0]);
            close(fds[1]);
        }
        execvp(c_args[0], c_args.data());
        _exit(EXEC_FAILED);
    }

    if (output) {
        close(fds[1]);
        std::array<char, 4096> buffer{};
        ssize_t n = 0;
        while ((n = read(fds[0], buffer.data(), buffer.size())) != 0) {
            if (n == -1) {
                if (errno == EINTR) continue;
                break;
            }
            output->append(buffer.data(), static_cast<size_t>(n));
        }
        close(fds[0]);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw FnpackException(string_format("error.wait_failed", strerror(errno)));
        }
    }
    const int ret = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (ret == EXEC_FAILED) {
        throw FnpackException(string_format("error.compiler_not_found", interpreter));
    }
    return ret;
}

} // anonymous namespace

bool compile_tree(const std::filesystem::path& root, const std::string& interpreter) {
    log_info(string_format("info.compiling", root.string()));

    const int ret = run_interpreter(interpreter, {"-m", "compileall", "-b", "-q", "-f", root.string()}, nullptr);
    if (ret != 0) {
        log_warning(string_format("warning.compile_incomplete", std::to_string(ret)));
        return false;
    }
    return true;
}

std::vector<std::filesystem::path> interpreter_site_dirs(const std::string& interpreter) {
    std::string output;
    const int ret = run_interpreter(
        interpreter,
        {"-c", "import os, sys\nfor p in sys.path:\n    if p and os.path.isdir(p): print(p)"},
        &output);
    if (ret != 0) {
        throw FnpackException(string_format("error.site_discovery_failed", interpreter, std::to_string(ret)));
    }

    std::vector<std::filesystem::path> dirs;
    for (const auto& line : split_lines(output)) {
        if (std::filesystem::is_directory(line)) dirs.emplace_back(line);
    }
    log_info(string_format("info.discovered_site_dirs", std::to_string(dirs.size()), interpreter));
    return dirs;
}
