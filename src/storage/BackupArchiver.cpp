#include "storage/BackupArchiver.hpp"
#include "config/Config.hpp"
#include "util/process.hpp"
#include "logging/LogRegistry.hpp"

using namespace wsync::storage;
using namespace wsync::logging;

BackupArchiver::BackupArchiver()
    : BackupArchiver("tar", config::WorkspaceConfig::defaultBackupExcludes()) {}

BackupArchiver::BackupArchiver(std::string tarExecutable, std::vector<std::string> excludes)
    : tar_(std::move(tarExecutable)), excludes_(std::move(excludes)) {}

std::vector<std::string> BackupArchiver::buildArguments(const std::filesystem::path& sourceDir,
                                                        const std::filesystem::path& archivePath) const {
    std::vector<std::string> args{tar_, "-czf", archivePath.string()};
    for (const auto& ex : excludes_) args.push_back("--exclude=" + ex);
    args.insert(args.end(), {"-C", sourceDir.string(), "."});
    return args;
}

void BackupArchiver::createArchive(const std::filesystem::path& sourceDir,
                                   const std::filesystem::path& archivePath) const {
    const auto result = util::runProcessChecked(buildArguments(sourceDir, archivePath), std::nullopt, {0, 1});
    if (result.exit_code == 1)
        LogRegistry::backup()->warn("[BackupArchiver] tar reported files changed during archiving of {}: {}",
                                    sourceDir.string(), result.output);
}
