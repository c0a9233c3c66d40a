// Source/driver_logger.cpp
#include "sqlforge_sqldriver/driver_logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>

namespace sqlforge_sqldriver {

    std::shared_ptr<spdlog::logger> get_or_create_logger(const std::string& logger_name, spdlog::level::level_enum level) {
        auto logger = spdlog::get(logger_name);
        if (logger) {
            return logger;
        }
        try {
            logger = spdlog::stdout_color_mt(logger_name);
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [tid %t] %v");
            logger->set_level(level);
        } catch (const spdlog::spdlog_ex& ex) {
            // 并发创建时另一个线程可能已注册同名 logger
            logger = spdlog::get(logger_name);
            if (!logger) {
                std::cerr << "Logger (" << logger_name << ") initialization failed: " << ex.what() << std::endl;
            }
        }
        return logger;
    }

    void set_driver_log_level(spdlog::level::level_enum level, const std::string& logger_name) {
        auto logger = get_or_create_logger(logger_name, level);
        if (logger) {
            logger->set_level(level);
        }
    }

}  // namespace sqlforge_sqldriver
