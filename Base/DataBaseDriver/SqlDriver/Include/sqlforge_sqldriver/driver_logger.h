// sqlforge_sqldriver/driver_logger.h
#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace sqlforge_sqldriver {

    inline constexpr const char* kDefaultLoggerName = "SqlForgeDriver";

    // 按名字取已注册的 logger, 不存在时创建 stdout 彩色 logger; 创建失败返回 nullptr
    std::shared_ptr<spdlog::logger> get_or_create_logger(const std::string& logger_name = kDefaultLoggerName, spdlog::level::level_enum level = spdlog::level::info);

    void set_driver_log_level(spdlog::level::level_enum level, const std::string& logger_name = kDefaultLoggerName);

}  // namespace sqlforge_sqldriver
