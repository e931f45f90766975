/**
 * @file config.hpp
 * @brief Конфигурация утилиты ergo-address
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 *
 * Пример конфигурации (ergo-address.toml):
 * @code
 * [network]
 * prefix = "mainnet"    # mainnet | testnet | 0..255
 *
 * [logging]
 * level = "info"        # error | warn | info | debug
 * color = true
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ergo {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Настройки сети
 */
struct NetworkConfig {
    /// @brief Префикс сети кодировщика (по умолчанию mainnet)
    uint8_t prefix = constants::MAINNET_PREFIX;
};

/**
 * @brief Уровень логирования
 */
enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
};

/**
 * @brief Разобрать уровень логирования из строки
 */
[[nodiscard]] Result<LogLevel> parse_log_level(std::string_view name);

/**
 * @brief Настройки логирования и терминального вывода
 */
struct LoggingConfig {
    /// @brief Уровень логирования
    LogLevel level = LogLevel::Info;

    /// @brief Включить ANSI цвета в терминале
    bool color = true;
};

/**
 * @brief Полная конфигурация
 */
struct Config {
    NetworkConfig network;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь (должен существовать)
     * 2. ./ergo-address.toml
     * 3. /etc/ergo-address/ergo-address.toml
     * 4. ~/.config/ergo-address/ergo-address.toml
     *
     * Если путь не указан и файл не найден, возвращается конфигурация
     * по умолчанию.
     *
     * @param path Опциональный путь к файлу
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Разобрать конфигурацию из строки TOML
     */
    [[nodiscard]] static Result<Config> parse(std::string_view toml_text);

    /**
     * @brief Валидация конфигурации
     *
     * @return Result<void> Успех или ошибка валидации
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace ergo
