#pragma once

#include <string>
#include <spdlog/spdlog.h>

const char* const sectorstore_logger_name = "sectorstore";

// Replaces spdlog's default logger with a rotating file logger, 5MB per file,
// 3 files kept. Calling it again swaps in a new file.
void init_logging(const std::string& log_file, spdlog::level::level_enum level = spdlog::level::info);
