#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace wsync::util {

struct ProcessResult {
    int exit_code = -1;
    std::string output;     // stdout and stderr, interleaved
};

class ProcessError : public std::runtime_error {
public:
    ProcessError(const std::string& what, ProcessResult result)
        : std::runtime_error(what), result_(std::move(result)) {}

    [[nodiscard]] const ProcessResult& result() const noexcept { return result_; }

private:
    ProcessResult result_;
};

// fork/execvp without a shell. Throws ProcessError when the child cannot be
// started; a non-zero exit is returned, not thrown.
ProcessResult runProcess(const std::vector<std::string>& args,
                         const std::optional<std::filesystem::path>& cwd = std::nullopt);

// As runProcess, but throws ProcessError unless the exit code is listed in `okCodes`.
ProcessResult runProcessChecked(const std::vector<std::string>& args,
                                const std::optional<std::filesystem::path>& cwd = std::nullopt,
                                const std::vector<int>& okCodes = {0});

[[nodiscard]] bool executableAvailable(const std::string& name);

}
