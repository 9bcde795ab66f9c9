#include "app/cli_options.hpp"

#include <cxxopts.hpp>

#include <cstdlib>
#include <iostream>

CLIOptions ParseCLIOptions(int argc, char *argv[]) {
    cxxopts::Options options("statusboard", "Game server status board for Discord channels");
    options.add_options()
        ("d,data-dir", "Data directory (overrides STATUSBOARD_DATA_DIR)", cxxopts::value<std::string>())
        ("c,config", "User config file path", cxxopts::value<std::string>())
        ("v,verbose", "Enable verbose logging")
        ("o,once", "Run a single update and exit")
        ("h,help", "Show help");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        std::cerr << options.help() << std::endl;
        std::exit(1);
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    CLIOptions parsed;
    parsed.dataDir = result.count("data-dir") ? result["data-dir"].as<std::string>() : std::string();
    parsed.userConfigPath = result.count("config") ? result["config"].as<std::string>() : std::string();
    parsed.dataDirExplicit = result.count("data-dir") > 0;
    parsed.userConfigExplicit = result.count("config") > 0;
    parsed.verbose = result.count("verbose") > 0;
    parsed.once = result.count("once") > 0;
    return parsed;
}
