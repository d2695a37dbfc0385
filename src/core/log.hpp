#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace scorch::log {

/// Installs the "scorch" logger as spdlog's default: a colour console sink
/// plus a file sink truncated on each run.
void init(const std::filesystem::path& log_file = "scorch.log",
          spdlog::level::level_enum level = spdlog::level::debug);

/// Flush and shutdown logging.
void shutdown();

/// Raise or lower the default logger's level ("trace".."off").
/// Unknown names leave the level unchanged and return false.
bool set_level(const std::string& level_name);

} // namespace scorch::log
