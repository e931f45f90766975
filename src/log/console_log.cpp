/**
 * @file console_log.cpp
 * @brief Реализация консольного вывода
 */

#include "console_log.hpp"

#include <iostream>

namespace ergo::log {

std::string_view level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARNING";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
    }
    return "UNKNOWN";
}

ConsoleLog::ConsoleLog(const LoggingConfig& config) noexcept
    : ConsoleLog(config, std::cout, std::cerr) {}

ConsoleLog::ConsoleLog(const LoggingConfig& config, std::ostream& out, std::ostream& err) noexcept
    : config_(config), out_(&out), err_(&err) {}

void ConsoleLog::write(LogLevel level, std::string_view message) const {
    if (!enabled(level)) {
        return;
    }

    std::ostream& stream = (level == LogLevel::Error || level == LogLevel::Warn) ? *err_ : *out_;

    // Цвет в зависимости от уровня
    const char* color = nullptr;
    if (config_.color) {
        switch (level) {
            case LogLevel::Error: color = "\033[31m"; break;
            case LogLevel::Warn: color = "\033[33m"; break;
            case LogLevel::Info: color = "\033[32m"; break;
            case LogLevel::Debug: break;
        }
    }

    if (color) {
        stream << color;
    }
    stream << "[" << level_to_string(level) << "] " << message;
    if (color) {
        stream << "\033[0m";
    }
    stream << std::endl;
}

} // namespace ergo::log
