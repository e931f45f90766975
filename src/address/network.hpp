/**
 * @file network.hpp
 * @brief Префиксы сетей Ergo
 *
 * Префикс сети складывается с кодом типа адреса в один байт заголовка:
 *
 *   header = (network_prefix + address_type) mod 256
 *
 * Mainnet = 0x00 даёт заголовки 0x01..0x03, Testnet = 0x10 даёт 0x11..0x13.
 * Сеть определяется по диапазону байта относительно границы 0x10,
 * а не по точному совпадению с префиксом.
 *
 * @warning Схема рассчитана ровно на две сети. Третий префикс потребует
 *          изменения формата адресов.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <cstdint>
#include <string_view>

namespace ergo::address {

/**
 * @brief Канонические префиксы сетей
 */
enum class NetworkPrefix : uint8_t {
    Mainnet = constants::MAINNET_PREFIX,
    Testnet = constants::TESTNET_PREFIX,
};

/**
 * @brief Байтовое значение префикса
 */
[[nodiscard]] constexpr uint8_t to_byte(NetworkPrefix prefix) noexcept {
    return static_cast<uint8_t>(prefix);
}

/**
 * @brief Относится ли префикс к testnet диапазону (>= 0x10)
 *
 * Префикс сравнивается как знаковый байт, так же как байт заголовка
 * при декодировании. Префиксы 0x80..0xFF проверяются по правилам mainnet.
 */
[[nodiscard]] constexpr bool is_testnet_prefix(uint8_t prefix) noexcept {
    return static_cast<int8_t>(prefix) >= constants::TESTNET_THRESHOLD;
}

/**
 * @brief Название сети: "mainnet", "testnet" или "custom"
 */
[[nodiscard]] std::string_view network_name(uint8_t prefix) noexcept;

/**
 * @brief Разобрать название сети
 *
 * Принимает "mainnet" или "main", "testnet" или "test" (в любом регистре),
 * либо десятичное значение байта 0..255.
 *
 * @param name Строка из конфигурации или командной строки
 * @return Result<uint8_t> Префикс сети или ConfigInvalidValue
 */
[[nodiscard]] Result<uint8_t> parse_network(std::string_view name);

} // namespace ergo::address
