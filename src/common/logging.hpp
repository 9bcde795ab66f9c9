#pragma once

#include <cstddef>
#include <string>

namespace statusboard::logging {

struct FileSinkOptions {
    std::string path;
    std::size_t maxFileSizeBytes = 10 * 1024 * 1024;
    std::size_t maxFiles = 2;
};

// Installs the default logger with a colored stdout sink.
void ConfigureLogging(bool verbose);

// Adds a size-rotating file sink to the default logger. An empty path leaves logging to stdout only.
bool AttachFileSink(const FileSinkOptions &options);

} // namespace statusboard::logging
