#include "util/TempFile.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <unistd.h>
#include <vector>
#include <fmt/core.h>

namespace wsync::util {

TempFile::TempFile(const std::string& suffix, const std::filesystem::path& dir, const std::string& prefix) {
    const std::string tmpl = (dir / (prefix + "XXXXXX" + suffix)).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd == -1)
        throw std::runtime_error(fmt::format("Failed to create temp file in {}: {}", dir.string(), std::strerror(errno)));
    close(fd);
    path_ = buf.data();
}

TempFile::~TempFile() { remove(); }

TempFile::TempFile(TempFile&& other) noexcept
    : path_(std::move(other.path_)), owned_(other.owned_) {
    other.owned_ = false;
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        owned_ = other.owned_;
        other.owned_ = false;
    }
    return *this;
}

std::filesystem::path TempFile::release() {
    owned_ = false;
    return path_;
}

void TempFile::remove() noexcept {
    if (!owned_ || path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    owned_ = false;
}

}
