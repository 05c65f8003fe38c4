#include "common/logging.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <memory>
#include "common/config.hpp"

namespace tabula {

namespace {

std::shared_ptr<logger_t> createLogger() {
    // stdout belongs to the terminal front end, diagnostics go to stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);

    auto logger = std::make_shared<logger_t>("tabula", console_sink);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger->set_level(spdlog::level::warn);
    return logger;
}

}  // namespace

logger_t& getLogger() {
    static auto logger = createLogger();
    return *logger;
}

void configureLogging(const LoggingConfig& config) {
    auto& logger = getLogger();
    logger.set_level(spdlog::level::from_str(config.level));

    // a file sink from an earlier call is replaced, not stacked
    auto& sinks = logger.sinks();
    auto isFileSink = [](const spdlog::sink_ptr& sink) {
        return std::dynamic_pointer_cast<spdlog::sinks::basic_file_sink_mt>(sink) != nullptr;
    };
    sinks.erase(std::remove_if(sinks.begin(), sinks.end(), isFileSink), sinks.end());

    if (config.file.empty()) {
        return;
    }

    try {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file.string(), true);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(std::move(file_sink));
    } catch (const spdlog::spdlog_ex& ex) {
        Logger::error("Could not open log file '{}': {}", config.file.string(), ex.what());
    }
}

}  // namespace tabula
