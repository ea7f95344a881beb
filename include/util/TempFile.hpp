#pragma once

#include <filesystem>
#include <string>

namespace wsync::util {

// mkstemps-backed temporary file, removed on destruction unless released.
class TempFile {
public:
    explicit TempFile(const std::string& suffix = "",
                      const std::filesystem::path& dir = std::filesystem::temp_directory_path(),
                      const std::string& prefix = "wsync-");
    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // Stop owning the file; the caller is now responsible for it.
    std::filesystem::path release();

private:
    std::filesystem::path path_;
    bool owned_ = true;

    void remove() noexcept;
};

}
