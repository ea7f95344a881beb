#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace wsync::storage {

class StorageError : public std::runtime_error {
public:
    enum class Kind { NotFound, PermissionDenied, Configuration, Transient, Unknown };

    StorageError(Kind kind, const std::string& what);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool isTransient() const noexcept { return kind_ == Kind::Transient; }
    [[nodiscard]] bool isNotFound() const noexcept { return kind_ == Kind::NotFound; }

    // PermissionDenied and Configuration must reach the caller immediately.
    [[nodiscard]] bool isFatal() const noexcept {
        return kind_ == Kind::PermissionDenied || kind_ == Kind::Configuration;
    }

private:
    Kind kind_;
};

std::string_view to_string(StorageError::Kind kind);

// Raised once at the end of a directory transfer when any file failed.
class TransferError : public StorageError {
public:
    TransferError(const std::string& operation, std::vector<std::string> failures, size_t attempted);

    // "relative/path: reason" per failed file
    [[nodiscard]] const std::vector<std::string>& failures() const noexcept { return failures_; }
    [[nodiscard]] size_t attempted() const noexcept { return attempted_; }

private:
    std::vector<std::string> failures_;
    size_t attempted_;
};

}
