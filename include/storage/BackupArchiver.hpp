#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace wsync::storage {

// Packs a directory into a gzip'd tarball by running tar as a child process.
class BackupArchiver {
public:
    BackupArchiver();
    BackupArchiver(std::string tarExecutable, std::vector<std::string> excludes);

    // Throws util::ProcessError if tar fails. Exit status 1 (files changed while
    // being read) still yields a usable archive and is only logged.
    void createArchive(const std::filesystem::path& sourceDir, const std::filesystem::path& archivePath) const;

    [[nodiscard]] std::vector<std::string> buildArguments(const std::filesystem::path& sourceDir,
                                                          const std::filesystem::path& archivePath) const;

    [[nodiscard]] const std::vector<std::string>& excludes() const { return excludes_; }

private:
    std::string tar_;
    std::vector<std::string> excludes_;
};

}
