#include "core/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace scorch::log {

void init(const std::filesystem::path& log_file,
          spdlog::level::level_enum level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        log_file.string(), true));
    // Keep the console readable; the file gets timestamps
    sinks[0]->set_pattern("[%^%l%$] %v");
    sinks[1]->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    auto logger =
        std::make_shared<spdlog::logger>("scorch", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    spdlog::info("Scorch v0.1.0 (log file: {})", log_file.string());
}

void shutdown() {
    spdlog::shutdown();
}

bool set_level(const std::string& level_name) {
    auto level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to "off"; only accept a real "off"
    if (level == spdlog::level::off && level_name != "off") {
        spdlog::warn("Unknown log level '{}'", level_name);
        return false;
    }
    spdlog::set_level(level);
    return true;
}

} // namespace scorch::log
