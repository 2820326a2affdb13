#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Call once at startup (e.g. in main()). Console + rotating file under logs/.
    void initialize(const std::string& base_log_filename = "wyckoff_backtest",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug);

    // Console-only logger, for tests and embedding the engine as a library
    void initializeConsole(spdlog::level::level_enum console_level = spdlog::level::warn);

    // Get the globally configured logger
    std::shared_ptr<spdlog::logger>& getLogger();

    // Helper function to set log level from string (useful for env vars/args)
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
