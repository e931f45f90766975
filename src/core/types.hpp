/**
 * @file types.hpp
 * @brief Базовые типы для Ergo Address
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: 32-байтный хеш (Blake2b-256)
 * - Hash192: 24-байтный усечённый хеш (содержимое P2SH адреса)
 * - Bytes: динамический массив байт
 * - Result<T>: обёртка std::expected для обработки ошибок
 *
 * @note Декодирование адресов работает с недоверенным вводом, поэтому
 *       все ошибки возвращаются как значения, а не исключения.
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ergo {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта)
 *
 * Результат Blake2b-256. Первые 4 байта используются как контрольная
 * сумма адреса.
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief 192-битный хеш (24 байта)
 *
 * Первые 24 байта Blake2b-256 от сериализованного скрипта.
 * Является содержимым Pay-to-Script-Hash адреса.
 */
using Hash192 = std::array<uint8_t, 24>;

/**
 * @brief Динамический массив байт
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

// =============================================================================
// Коды ошибок
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Каждая ошибка декодирования адреса имеет собственный код, чтобы
 * вызывающий код мог различать их без разбора сообщения.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Ошибки кодирования (200-299)
    EncodingInvalidHex = 200,

    // Ошибки адресов (600-699)
    AddressMalformedEncoding = 600,
    AddressTooShort = 601,
    AddressNetworkMismatch = 602,
    AddressUnsupportedType = 603,
    AddressChecksumMismatch = 604,
    AddressInvalidContentLength = 605,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::EncodingInvalidHex: return "Некорректная hex строка";
        case ErrorCode::AddressMalformedEncoding: return "Строка не является корректным base58";
        case ErrorCode::AddressTooShort: return "Адрес слишком короткий";
        case ErrorCode::AddressNetworkMismatch: return "Адрес принадлежит другой сети";
        case ErrorCode::AddressUnsupportedType: return "Неподдерживаемый тип адреса";
        case ErrorCode::AddressChecksumMismatch: return "Неверная контрольная сумма адреса";
        case ErrorCode::AddressInvalidContentLength: return "Некорректная длина содержимого адреса";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    /**
     * @brief Оператор сравнения (по коду)
     */
    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * Обёртка над std::expected для единообразной обработки ошибок.
 *
 * @tparam T Тип возвращаемого значения
 *
 * Пример использования:
 * @code
 * auto address = AddressEncoder::mainnet().decode(text);
 * if (!address) {
 *     std::cerr << address.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace ergo
