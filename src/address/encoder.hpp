/**
 * @file encoder.hpp
 * @brief Кодирование адресов Ergo в Base58 строку и обратно
 *
 * Формат закодированного адреса:
 * @code
 * [1 байт: header = network_prefix + address_type]
 * [content_bytes]
 * [4 байта: checksum = blake2b256(header ++ content_bytes)[0:4]]
 * @endcode
 * Всё вместе кодируется в Base58.
 *
 * Сложение префикса и типа в одном байте - часть формата передачи,
 * его нельзя заменять раздельными полями.
 *
 * Кодировщик неизменяем после создания и может использоваться из
 * нескольких потоков без синхронизации.
 */

#pragma once

#include "address.hpp"
#include "network.hpp"
#include "../core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace ergo::address {

/**
 * @brief Кодировщик адресов для одной сети
 */
class AddressEncoder {
public:
    /**
     * @brief Создать кодировщик для произвольного префикса
     *
     * Префиксы >= 0x10 проверяются по testnet диапазону,
     * меньшие - по mainnet диапазону.
     */
    explicit constexpr AddressEncoder(uint8_t network_prefix) noexcept
        : network_prefix_(network_prefix) {}

    explicit constexpr AddressEncoder(NetworkPrefix network_prefix) noexcept
        : network_prefix_(to_byte(network_prefix)) {}

    /// @brief Кодировщик mainnet (префикс 0x00)
    [[nodiscard]] static constexpr AddressEncoder mainnet() noexcept {
        return AddressEncoder(NetworkPrefix::Mainnet);
    }

    /// @brief Кодировщик testnet (префикс 0x10)
    [[nodiscard]] static constexpr AddressEncoder testnet() noexcept {
        return AddressEncoder(NetworkPrefix::Testnet);
    }

    [[nodiscard]] constexpr uint8_t network_prefix() const noexcept { return network_prefix_; }

    /**
     * @brief Закодировать адрес в Base58 строку
     *
     * Не может завершиться ошибкой.
     *
     * @param address Адрес любого типа
     * @return std::string Base58 строка
     */
    [[nodiscard]] std::string encode(const Address& address) const;

    /**
     * @brief Декодировать Base58 строку в адрес
     *
     * Порядок проверок:
     * 1. Base58 (AddressMalformedEncoding)
     * 2. Минимальная длина 5 байт (AddressTooShort)
     * 3. Диапазон сети байта заголовка (AddressNetworkMismatch)
     * 4. Тип адреса в {1, 2, 3} (AddressUnsupportedType)
     * 5. Контрольная сумма (AddressChecksumMismatch)
     * 6. Длина содержимого P2SH (AddressInvalidContentLength)
     *
     * @param text Base58 строка адреса
     * @return Result<Address> Адрес или ошибка
     */
    [[nodiscard]] Result<Address> decode(std::string_view text) const;

    /**
     * @brief Является ли байт заголовком testnet адреса (> 0x10)
     *
     * Байт сравнивается как знаковый: 0x80..0xFF отрицательны и
     * к testnet не относятся.
     */
    [[nodiscard]] static constexpr bool is_testnet_address(uint8_t head_byte) noexcept {
        return static_cast<int8_t>(head_byte) > constants::TESTNET_THRESHOLD;
    }

    /**
     * @brief Является ли байт заголовком mainnet адреса (< 0x10)
     *
     * Знаковое сравнение: 0x80..0xFF проходят проверку сети и
     * отклоняются уже как неподдерживаемый тип.
     */
    [[nodiscard]] static constexpr bool is_mainnet_address(uint8_t head_byte) noexcept {
        return static_cast<int8_t>(head_byte) < constants::TESTNET_THRESHOLD;
    }

private:
    uint8_t network_prefix_;
};

/**
 * @brief Строковое представление адреса в сети кодировщика
 */
[[nodiscard]] std::string to_string(const Address& address, const AddressEncoder& encoder);

} // namespace ergo::address
