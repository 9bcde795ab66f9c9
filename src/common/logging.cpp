#include "common/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace statusboard::logging {

namespace {
constexpr const char *kVerbosePattern = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v";
constexpr const char *kDefaultPattern = "%Y-%m-%d %H:%M:%S [%^%l%$] %v";
}

void ConfigureLogging(bool verbose) {
    static bool installed = false;
    if (!installed) {
        auto logger = std::make_shared<spdlog::logger>("statusboard",
            std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        spdlog::set_default_logger(logger);
        installed = true;
    }

    if (verbose) {
        spdlog::set_level(spdlog::level::trace);
        spdlog::set_pattern(kVerbosePattern);
    } else {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern(kDefaultPattern);
    }
}

bool AttachFileSink(const FileSinkOptions &options) {
    if (options.path.empty()) {
        return false;
    }

    try {
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.path, options.maxFileSizeBytes, options.maxFiles);
        sink->set_pattern("%Y-%m-%d %H:%M:%S.%e:%l:%v");
        spdlog::default_logger()->sinks().push_back(std::move(sink));
    } catch (const spdlog::spdlog_ex &ex) {
        spdlog::error("Failed to open log file {}: {}", options.path, ex.what());
        return false;
    }

    spdlog::debug("Logging to {}", options.path);
    return true;
}

} // namespace statusboard::logging
