#pragma once

#include <string>

struct CLIOptions {
    std::string dataDir;
    std::string userConfigPath;
    bool dataDirExplicit = false;
    bool userConfigExplicit = false;
    bool verbose = false;
    bool once = false;
};

CLIOptions ParseCLIOptions(int argc, char *argv[]);
