#include "app/app_config.hpp"
#include "app/application.hpp"
#include "app/cli_options.hpp"
#include "common/config_validation.hpp"
#include "common/curl_global.hpp"
#include "common/data_path_resolver.hpp"
#include "common/i18n.hpp"
#include "common/logging.hpp"
#include "spdlog/spdlog.h"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <stdexcept>
#include <vector>

std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    (void)signum;
    g_running = false;
}

int main(int argc, char *argv[]) {
    statusboard::logging::ConfigureLogging(false);

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    const CLIOptions cliOptions = ParseCLIOptions(argc, argv);
    if (cliOptions.verbose) {
        statusboard::logging::ConfigureLogging(true);
    }

    try {
        if (cliOptions.dataDirExplicit) {
            statusboard::data::SetDataRootOverride(cliOptions.dataDir);
        }
        spdlog::debug("Using data directory {}", statusboard::data::DataRoot().string());
    } catch (const std::exception &ex) {
        spdlog::error("{}", ex.what());
        return 1;
    }

    std::vector<statusboard::data::ConfigLayerSpec> configSpecs = {
        {"config.json", "data/config.json", spdlog::level::err, true}
    };
    if (cliOptions.userConfigExplicit) {
        configSpecs.push_back({std::filesystem::absolute(cliOptions.userConfigPath), "user config", spdlog::level::err, true});
    }
    if (!statusboard::data::InitializeConfigCache(configSpecs)) {
        spdlog::error("main: Failed to load configuration");
        return 1;
    }

    const auto issues = statusboard::config::ValidateRequiredKeys(statusboard::config::StatusboardRequiredKeys());
    if (!issues.empty()) {
        for (const auto &issue : issues) {
            spdlog::error("Config '{}': {}", issue.path, issue.message);
        }
        return 1;
    }

    statusboard::i18n::Get().loadFromConfig();

    auto settings = LoadAppSettings();
    if (!settings) {
        return 1;
    }
    statusboard::logging::AttachFileSink(settings->logFile);

    if (!statusboard::net::EnsureCurlGlobalInit()) {
        spdlog::error("main: Failed to initialize cURL");
        return 1;
    }

    Application app(std::move(*settings));
    if (!app.initialize()) {
        spdlog::error("main: Server discovery is not configured correctly");
        return 1;
    }

    if (cliOptions.once) {
        app.runOnce();
    } else {
        app.run(g_running);
    }

    spdlog::info("Shutdown complete");
    return 0;
}
