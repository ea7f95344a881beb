#include "util/process.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>

namespace wsync::util {

ProcessResult runProcess(const std::vector<std::string>& args, const std::optional<std::filesystem::path>& cwd) {
    if (args.empty()) throw std::invalid_argument("runProcess: empty argument list");

    // Prepared before fork; the child must not allocate.
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    const std::string dir = cwd ? cwd->string() : std::string();

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1)
        throw ProcessError(fmt::format("Failed to create pipe for {}: {}", args[0], std::strerror(errno)), {});

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        throw ProcessError(fmt::format("Failed to fork {}: {}", args[0], std::strerror(errno)), {});
    }

    if (pid == 0) {
        // Child process: stdout and stderr into the pipe, stdin from /dev/null
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        if (const int devnull = open("/dev/null", O_RDONLY); devnull >= 0) dup2(devnull, STDIN_FILENO);
        if (!dir.empty() && chdir(dir.c_str()) != 0) _exit(126);
        execvp(argv[0], argv.data());
        _exit(127); // exec failed
    }

    close(pipefd[1]);

    ProcessResult result;
    char buf[4096];
    while (true) {
        const ssize_t n = read(pipefd[0], buf, sizeof(buf));
        if (n > 0) result.output.append(buf, static_cast<size_t>(n));
        else if (n == 0) break;
        else if (errno != EINTR) break;
    }
    close(pipefd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR)
            throw ProcessError(fmt::format("waitpid failed for {}: {}", args[0], std::strerror(errno)), result);
    }

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exit_code = 128 + WTERMSIG(status);

    if (result.exit_code == 127)
        throw ProcessError(fmt::format("Failed to execute {}", args[0]), result);
    if (result.exit_code == 126 && !dir.empty())
        throw ProcessError(fmt::format("Failed to enter {} for {}", dir, args[0]), result);

    return result;
}

ProcessResult runProcessChecked(const std::vector<std::string>& args,
                                const std::optional<std::filesystem::path>& cwd,
                                const std::vector<int>& okCodes) {
    auto result = runProcess(args, cwd);
    if (std::ranges::find(okCodes, result.exit_code) == okCodes.end()) {
        std::string cmd;
        for (const auto& a : args) {
            if (!cmd.empty()) cmd += ' ';
            cmd += a;
        }
        auto what = fmt::format("'{}' exited with status {}: {}", cmd, result.exit_code, result.output);
        throw ProcessError(what, std::move(result));
    }
    return result;
}

bool executableAvailable(const std::string& name) {
    if (name.find('/') != std::string::npos) return access(name.c_str(), X_OK) == 0;

    const char* path = std::getenv("PATH");
    if (!path) return false;

    std::string_view rest(path);
    while (!rest.empty()) {
        const auto colon = rest.find(':');
        const auto dir = rest.substr(0, colon);
        if (!dir.empty()) {
            const auto candidate = std::filesystem::path(dir) / name;
            if (access(candidate.c_str(), X_OK) == 0) return true;
        }
        if (colon == std::string_view::npos) break;
        rest.remove_prefix(colon + 1);
    }
    return false;
}

}
