/**
 * @file base58.hpp
 * @brief Base58 кодирование (алфавит Bitcoin)
 *
 * Алфавит исключает визуально похожие символы: 0, O, I, l.
 * Ведущие нулевые байты кодируются символом '1'.
 */

#pragma once

#include "../core/types.hpp"

#include <string>
#include <string_view>

namespace ergo::encoding {

/// @brief Алфавит Base58
inline constexpr std::string_view BASE58_ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

/**
 * @brief Закодировать байты в Base58
 *
 * @param data Входные данные
 * @return std::string Base58 строка (пустая для пустого ввода)
 */
[[nodiscard]] std::string base58_encode(ByteSpan data);

/**
 * @brief Декодировать Base58 строку
 *
 * @param str Base58 строка
 * @return Result<Bytes> Байты или AddressMalformedEncoding, если строка
 *         пуста или содержит символ вне алфавита
 */
[[nodiscard]] Result<Bytes> base58_decode(std::string_view str);

/**
 * @brief Проверить, состоит ли строка только из символов Base58
 *
 * @return true если строка непуста и все символы из алфавита
 */
[[nodiscard]] bool is_base58(std::string_view str) noexcept;

} // namespace ergo::encoding
