#pragma once

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

using std::string;

// Type for logger pointers
using logger_t = std::shared_ptr<spdlog::logger>;

// Global variables to simplify formatting
const string dim_code{"\e[0m\e[2m"}, normal_code{"\e[0m"};
const string colored_pattern_prefix{"[" + dim_code + "%Y-%m-%d %H:%M:%S.%e" + normal_code + "] [" +
                                    dim_code + "%n" + normal_code + "] [" + dim_code + "%^%l%$" +
                                    normal_code + "] "};

// Factory functions to create loggers
// Console loggers write to stderr: stdout may carry the word list itself.
inline logger_t console_logger(const string& name) {
    auto result = spdlog::get(name);
    if (result == nullptr) {
        result = spdlog::stderr_color_mt(name);
        result->set_pattern(colored_pattern_prefix + "%v");
    }
    return result;
}

inline logger_t global_logger() { return console_logger("global"); }

// Applies to every registered logger, including the ones created later
inline void set_verbose(bool verbose) {
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

// Macros for global logging
#define INFO(...) SPDLOG_LOGGER_INFO(global_logger(), __VA_ARGS__)
#define WARNING(...) SPDLOG_LOGGER_WARN(global_logger(), __VA_ARGS__)
#define ERROR(...) SPDLOG_LOGGER_ERROR(global_logger(), __VA_ARGS__)
#define DEBUG(...) SPDLOG_LOGGER_DEBUG(global_logger(), __VA_ARGS__)
#define TRACE(...) SPDLOG_LOGGER_TRACE(global_logger(), __VA_ARGS__)
