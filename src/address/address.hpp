/**
 * @file address.hpp
 * @brief Модель адресов Ergo
 *
 * Адрес - это закрытое множество из трёх вариантов:
 * - P2PK (0x01): сериализованный (сжатый) публичный ключ
 * - P2SH (0x02): первые 192 бита Blake2b-256 от сериализованного скрипта
 * - P2S  (0x03): сериализованный скрипт
 *
 * Содержимое адреса не включает байт заголовка и контрольную сумму,
 * ими управляет AddressEncoder. Сеть тоже не является частью адреса:
 * один и тот же адрес кодируется в mainnet или testnet строку в
 * зависимости от кодировщика.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>

namespace ergo::address {

/**
 * @brief Код типа адреса
 *
 * Добавляется к префиксу сети в байте заголовка. Добавление нового
 * типа меняет формат.
 */
enum class AddressType : uint8_t {
    P2PK = constants::P2PK_TYPE,
    P2SH = constants::P2SH_TYPE,
    P2S = constants::P2S_TYPE,
};

/**
 * @brief Название типа: "P2PK", "P2SH" или "P2S"
 */
[[nodiscard]] std::string_view type_name(AddressType type) noexcept;

/**
 * @brief Преобразовать байт в код типа
 *
 * @return std::nullopt для значений вне {1, 2, 3}
 */
[[nodiscard]] std::optional<AddressType> address_type_from_byte(uint8_t value) noexcept;

// =============================================================================
// Варианты адресов
// =============================================================================

/**
 * @brief Pay-to-PublicKey адрес
 *
 * Конструктор не проверяет содержимое.
 */
class P2PKAddress {
public:
    static constexpr AddressType TYPE = AddressType::P2PK;

    explicit P2PKAddress(Bytes pubkey) noexcept : pubkey_(std::move(pubkey)) {}

    [[nodiscard]] AddressType type_tag() const noexcept { return TYPE; }

    [[nodiscard]] const Bytes& content_bytes() const noexcept { return pubkey_; }

    [[nodiscard]] bool operator==(const P2PKAddress&) const = default;

private:
    Bytes pubkey_;
};

/**
 * @brief Pay-to-Script-Hash адрес
 *
 * Содержимое - ровно 24 байта. Создаётся только через create(),
 * from_hash() или from_script().
 */
class Pay2SHAddress {
public:
    static constexpr AddressType TYPE = AddressType::P2SH;

    /**
     * @brief Создать адрес из 24-байтного хеша скрипта
     *
     * @param script_hash Хеш скрипта
     * @return Result<Pay2SHAddress> Адрес или AddressInvalidContentLength
     */
    [[nodiscard]] static Result<Pay2SHAddress> create(Bytes script_hash);

    /**
     * @brief Создать адрес из готового 192-битного хеша
     */
    [[nodiscard]] static Pay2SHAddress from_hash(const Hash192& script_hash);

    /**
     * @brief Создать адрес из сериализованного скрипта
     *
     * Содержимое = hash192(script), т.е. первые 24 байта Blake2b-256.
     */
    [[nodiscard]] static Pay2SHAddress from_script(ByteSpan script);

    [[nodiscard]] AddressType type_tag() const noexcept { return TYPE; }

    [[nodiscard]] const Bytes& content_bytes() const noexcept { return script_hash_; }

    [[nodiscard]] bool operator==(const Pay2SHAddress&) const = default;

private:
    explicit Pay2SHAddress(Bytes script_hash) noexcept
        : script_hash_(std::move(script_hash)) {}

    Bytes script_hash_;
};

/**
 * @brief Pay-to-Script адрес
 *
 * Конструктор не проверяет содержимое.
 */
class Pay2SAddress {
public:
    static constexpr AddressType TYPE = AddressType::P2S;

    explicit Pay2SAddress(Bytes script) noexcept : script_(std::move(script)) {}

    [[nodiscard]] AddressType type_tag() const noexcept { return TYPE; }

    [[nodiscard]] const Bytes& content_bytes() const noexcept { return script_; }

    [[nodiscard]] bool operator==(const Pay2SAddress&) const = default;

private:
    Bytes script_;
};

/**
 * @brief Адрес Ergo (tagged union)
 *
 * Два адреса равны, если совпадают вариант и содержимое побайтно.
 */
using Address = std::variant<P2PKAddress, Pay2SHAddress, Pay2SAddress>;

/**
 * @brief Код типа адреса
 */
[[nodiscard]] AddressType type_tag(const Address& address) noexcept;

/**
 * @brief Содержимое адреса (без заголовка и контрольной суммы)
 */
[[nodiscard]] const Bytes& content_bytes(const Address& address) noexcept;

/**
 * @brief Является ли адрес Pay-to-PublicKey
 */
[[nodiscard]] bool is_p2pk(const Address& address) noexcept;

} // namespace ergo::address
