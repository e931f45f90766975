/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "../address/encoder.hpp"
#include "../address/network.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>
#include <vector>

namespace ergo {

namespace {

/**
 * @brief Заполнить конфигурацию из разобранной TOML таблицы
 */
Result<Config> from_table(const toml::table& table) {
    Config config;

    // === Секция [network] ===
    if (auto network = table["network"].as_table()) {
        if (auto val = (*network)["prefix"].value<std::string>()) {
            auto prefix = address::parse_network(*val);
            if (!prefix) {
                return std::unexpected(prefix.error());
            }
            config.network.prefix = *prefix;
        } else if (auto num = (*network)["prefix"].value<int64_t>()) {
            if (*num < 0 || *num > 0xFF) {
                return Err<Config>(
                    ErrorCode::ConfigInvalidValue,
                    std::format("network.prefix вне диапазона байта: {}", *num)
                );
            }
            config.network.prefix = static_cast<uint8_t>(*num);
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            auto level = parse_log_level(*val);
            if (!level) {
                return std::unexpected(level.error());
            }
            config.logging.level = *level;
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
    }

    return config;
}

} // anonymous namespace

Result<LogLevel> parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "error") return LogLevel::Error;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "info") return LogLevel::Info;
    if (lower == "debug") return LogLevel::Debug;

    return Err<LogLevel>(
        ErrorCode::ConfigInvalidValue,
        std::format("Неизвестный уровень логирования: '{}'", name)
    );
}

// =============================================================================
// Config - Загрузка
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view toml_text) {
    try {
        auto table = toml::parse(toml_text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный файл обязан существовать
    if (path.has_value()) {
        return load(path.value());
    }

    // Стандартные пути
    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back(constants::DEFAULT_CONFIG_FILE);
    search_paths.push_back(std::filesystem::path("/etc/ergo-address") / constants::DEFAULT_CONFIG_FILE);

    // Домашняя директория пользователя
    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "ergo-address" / constants::DEFAULT_CONFIG_FILE
        );
    }

    // Ищем первый существующий файл
    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Config{};
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    const bool testnet = address::is_testnet_prefix(network.prefix);

    // Заголовки всех трёх типов должны проходить проверку сети при
    // декодировании, иначе часть адресов нельзя будет прочитать обратно
    for (uint8_t type : {constants::P2PK_TYPE, constants::P2SH_TYPE, constants::P2S_TYPE}) {
        const auto header = static_cast<uint8_t>(network.prefix + type);
        const bool accepted = testnet
            ? address::AddressEncoder::is_testnet_address(header)
            : address::AddressEncoder::is_mainnet_address(header);

        if (!accepted) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                std::format("Префикс сети {} даёт заголовок 0x{:02x} вне диапазона {}",
                            static_cast<unsigned>(network.prefix),
                            static_cast<unsigned>(header),
                            testnet ? "testnet" : "mainnet")
            );
        }
    }

    return {};
}

} // namespace ergo
