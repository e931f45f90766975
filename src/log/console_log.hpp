/**
 * @file console_log.hpp
 * @brief Консольный вывод сообщений с уровнями
 *
 * Формат: "[LEVEL] сообщение". Ошибки и предупреждения идут в stderr,
 * остальное в stdout. Используется только утилитой командной строки,
 * библиотека кодирования адресов ничего не логирует.
 */

#pragma once

#include "../core/config.hpp"

#include <iosfwd>
#include <string_view>

namespace ergo::log {

/**
 * @brief Строковое имя уровня ("ERROR", "WARNING", "INFO", "DEBUG")
 */
[[nodiscard]] std::string_view level_to_string(LogLevel level) noexcept;

class ConsoleLog {
public:
    explicit ConsoleLog(const LoggingConfig& config) noexcept;

    ConsoleLog(const LoggingConfig& config, std::ostream& out, std::ostream& err) noexcept;

    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) <= static_cast<int>(config_.level);
    }

    void error(std::string_view message) const { write(LogLevel::Error, message); }
    void warn(std::string_view message) const { write(LogLevel::Warn, message); }
    void info(std::string_view message) const { write(LogLevel::Info, message); }
    void debug(std::string_view message) const { write(LogLevel::Debug, message); }

    void write(LogLevel level, std::string_view message) const;

private:
    LoggingConfig config_;
    std::ostream* out_;
    std::ostream* err_;
};

} // namespace ergo::log
