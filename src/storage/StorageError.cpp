#include "storage/StorageError.hpp"

#include <fmt/core.h>

namespace wsync::storage {

StorageError::StorageError(const Kind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

std::string_view to_string(const StorageError::Kind kind) {
    switch (kind) {
        case StorageError::Kind::NotFound: return "not_found";
        case StorageError::Kind::PermissionDenied: return "permission_denied";
        case StorageError::Kind::Configuration: return "configuration";
        case StorageError::Kind::Transient: return "transient";
        case StorageError::Kind::Unknown: return "unknown";
    }
    return "unknown";
}

static std::string summarize(const std::string& operation, const std::vector<std::string>& failures,
                             const size_t attempted) {
    std::string msg = fmt::format("{}: {} of {} transfers failed", operation, failures.size(), attempted);
    constexpr size_t shown = 5;
    for (size_t i = 0; i < failures.size() && i < shown; ++i) msg += "\n  " + failures[i];
    if (failures.size() > shown) msg += fmt::format("\n  ... and {} more", failures.size() - shown);
    return msg;
}

TransferError::TransferError(const std::string& operation, std::vector<std::string> failures, const size_t attempted)
    : StorageError(Kind::Unknown, summarize(operation, failures, attempted)),
      failures_(std::move(failures)), attempted_(attempted) {}

}
