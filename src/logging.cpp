#include <spdlog/sinks/rotating_file_sink.h>

#include "../include/logging.hpp"

void init_logging(const std::string& log_file, spdlog::level::level_enum level)
{
    spdlog::drop(sectorstore_logger_name);

    auto logger = spdlog::rotating_logger_mt(sectorstore_logger_name, log_file, 5ULL << 20, 3);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
}
