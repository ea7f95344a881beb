#pragma once

#include <exception>
#include <string>

namespace wsync::concurrency {

struct TaskOutcome {
    std::string label;              // usually the workspace-relative path
    std::exception_ptr error;       // null on success

    [[nodiscard]] bool ok() const { return !error; }
};

}
