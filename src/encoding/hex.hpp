/**
 * @file hex.hpp
 * @brief Преобразование байт в hex строку и обратно
 */

#pragma once

#include "../core/types.hpp"

#include <string>
#include <string_view>

namespace ergo::encoding {

/**
 * @brief Закодировать байты в hex строку (нижний регистр)
 */
[[nodiscard]] std::string to_hex(ByteSpan data);

/**
 * @brief Декодировать hex строку
 *
 * Принимает символы в любом регистре и необязательный префикс "0x".
 *
 * @return Result<Bytes> Байты или EncodingInvalidHex
 */
[[nodiscard]] Result<Bytes> from_hex(std::string_view hex);

} // namespace ergo::encoding
