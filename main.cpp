// Workspace
#include "workspace/WorkspaceManager.hpp"
#include "workspace/ShutdownHooks.hpp"

// Storage
#include "storage/S3WorkspaceStorage.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace wsync::config;
using namespace wsync::logging;
using namespace wsync::storage;
using namespace wsync::workspace;

namespace {

struct CliOptions {
    std::string user;
    std::string conversation;
    std::optional<std::string> workspace;
    std::optional<std::string> config;
    bool printConfig = false;
};

void usage(std::ostream& out) {
    out << "usage: wsyncd --user <id> --conversation <id> [--workspace <path>] [--config <file.yaml>]\n"
           "       wsyncd --print-config [--config <file.yaml>]\n"
           "\n"
           "Mirrors a conversation workspace to S3-compatible storage until SIGTERM/SIGINT.\n"
           "SIGUSR1 triggers an immediate full sync.\n";
}

std::optional<CliOptions> parseArgs(const int argc, char** argv) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        const auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(fmt::format("{} requires a value", arg));
            return argv[++i];
        };

        if (arg == "--user") opts.user = value();
        else if (arg == "--conversation") opts.conversation = value();
        else if (arg == "--workspace") opts.workspace = value();
        else if (arg == "--config") opts.config = value();
        else if (arg == "--print-config") opts.printConfig = true;
        else if (arg == "-h" || arg == "--help") return std::nullopt;
        else throw std::invalid_argument(fmt::format("unknown option '{}'", arg));
    }

    if (!opts.printConfig && (opts.user.empty() || opts.conversation.empty()))
        throw std::invalid_argument("--user and --conversation are required");
    return opts;
}

}

int main(int argc, char** argv) {
    CliOptions cli;
    try {
        const auto parsed = parseArgs(argc, argv);
        if (!parsed) {
            usage(std::cout);
            return EXIT_SUCCESS;
        }
        cli = *parsed;
    } catch (const std::invalid_argument& e) {
        std::cerr << "wsyncd: " << e.what() << "\n\n";
        usage(std::cerr);
        return 2;
    }

    try {
        if (cli.config) ConfigRegistry::init(loadConfig(*cli.config));
        else ConfigRegistry::init(loadConfigFromString(""));
    } catch (const std::exception& e) {
        std::cerr << "wsyncd: failed to load configuration: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (cli.printConfig) {
        std::cout << nlohmann::json(ConfigRegistry::get()).dump(2) << std::endl;
        return EXIT_SUCCESS;
    }

    std::shared_ptr<WorkspaceManager> manager;
    try {
        const auto& cfg = ConfigRegistry::get();
        LogRegistry::init(cfg.logging.log_dir);

        const auto workspacePath = cli.workspace ? std::filesystem::path(*cli.workspace) : cfg.workspace.root_path;
        LogRegistry::wsync()->info("[*] Starting wsyncd for conversation {} (user {}) at {}",
                                   cli.conversation, cli.user, workspacePath.string());

        auto storage = std::make_shared<S3WorkspaceStorage>(cfg.storage);
        manager = std::make_shared<WorkspaceManager>(storage, cli.conversation, cli.user, workspacePath,
                                                     ManagerOptions::fromConfig(cfg));

        ShutdownHooks::installSignalHandlers();
        ShutdownHooks::instance().registerHook("final-sync:" + cli.conversation, [manager] { manager->finalSync(); });
        ShutdownHooks::registerAtExit(cfg.workspace.final_sync_timeout);

        manager->initialize();
        LogRegistry::wsync()->info("[✓] Workspace sync running for conversation {}", cli.conversation);
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized())
            LogRegistry::wsync()->error("[-] Failed to initialize wsyncd: {}", e.what());
        else
            std::cerr << "wsyncd: failed to initialize: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    while (!ShutdownHooks::terminationRequested()) {
        if (ShutdownHooks::takeSyncRequest()) manager->manualSync();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LogRegistry::wsync()->info("[!] Termination requested, running final sync...");
    const bool inTime = ShutdownHooks::instance().runAll(ConfigRegistry::get().workspace.final_sync_timeout);
    if (inTime) LogRegistry::wsync()->info("[✓] wsyncd shut down cleanly.");
    else LogRegistry::wsync()->error("[-] Final sync did not finish in time, exiting anyway.");
    LogRegistry::shutdown();

    if (!inTime) std::_Exit(EXIT_FAILURE);
    return EXIT_SUCCESS;
}
