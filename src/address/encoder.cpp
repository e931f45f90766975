/**
 * @file encoder.cpp
 * @brief Реализация кодирования адресов
 */

#include "encoder.hpp"
#include "../crypto/blake2b.hpp"
#include "../encoding/base58.hpp"

#include <algorithm>
#include <array>
#include <format>

namespace ergo::address {

namespace {

/**
 * @brief Первые 4 байта Blake2b-256
 */
std::array<uint8_t, constants::CHECKSUM_LENGTH> checksum(ByteSpan data) noexcept {
    const Hash256 hash = crypto::blake2b256(data);

    std::array<uint8_t, constants::CHECKSUM_LENGTH> result;
    std::copy_n(hash.begin(), result.size(), result.begin());
    return result;
}

} // anonymous namespace

// =============================================================================
// Кодирование
// =============================================================================

std::string AddressEncoder::encode(const Address& address) const {
    const Bytes& content = content_bytes(address);

    // Сложение по модулю 256
    const auto header = static_cast<uint8_t>(
        network_prefix_ + static_cast<uint8_t>(type_tag(address))
    );

    Bytes payload;
    payload.reserve(1 + content.size() + constants::CHECKSUM_LENGTH);
    payload.push_back(header);
    payload.insert(payload.end(), content.begin(), content.end());

    const auto sum = checksum(payload);
    payload.insert(payload.end(), sum.begin(), sum.end());

    return encoding::base58_encode(payload);
}

// =============================================================================
// Декодирование
// =============================================================================

Result<Address> AddressEncoder::decode(std::string_view text) const {
    // === Шаг 1: Base58 ===
    auto decoded = encoding::base58_decode(text);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }
    const Bytes& bytes = *decoded;

    // === Шаг 2: Длина ===
    if (bytes.size() < constants::MIN_ENCODED_LENGTH) {
        return Err<Address>(
            ErrorCode::AddressTooShort,
            std::format("Адрес слишком короткий: {} байт (минимум {})",
                        bytes.size(), constants::MIN_ENCODED_LENGTH)
        );
    }

    // === Шаг 3: Сеть ===
    const uint8_t head_byte = bytes.front();
    if (is_testnet_prefix(network_prefix_)) {
        if (!is_testnet_address(head_byte)) {
            return Err<Address>(
                ErrorCode::AddressNetworkMismatch,
                "Адрес mainnet декодируется кодировщиком testnet"
            );
        }
    } else if (!is_mainnet_address(head_byte)) {
        return Err<Address>(
            ErrorCode::AddressNetworkMismatch,
            "Адрес testnet декодируется кодировщиком mainnet"
        );
    }

    // === Шаг 4: Тип адреса ===
    const auto type_byte = static_cast<uint8_t>(head_byte - network_prefix_);
    const auto type = address_type_from_byte(type_byte);
    if (!type) {
        return Err<Address>(
            ErrorCode::AddressUnsupportedType,
            std::format("Неподдерживаемый тип адреса: {}",
                        static_cast<int>(static_cast<int8_t>(type_byte)))
        );
    }

    // === Шаг 5-6: Контрольная сумма ===
    const auto body_size = bytes.size() - constants::CHECKSUM_LENGTH;
    const ByteSpan without_checksum(bytes.data(), body_size);
    const auto computed = checksum(without_checksum);

    if (!std::equal(computed.begin(), computed.end(), bytes.begin() + static_cast<std::ptrdiff_t>(body_size))) {
        return Err<Address>(
            ErrorCode::AddressChecksumMismatch,
            std::format("Неверная контрольная сумма адреса {}", text)
        );
    }

    // === Шаг 7: Содержимое ===
    Bytes content(bytes.begin() + 1, bytes.begin() + static_cast<std::ptrdiff_t>(body_size));

    // === Шаг 8: Вариант адреса ===
    switch (*type) {
        case AddressType::P2PK:
            return P2PKAddress(std::move(content));

        case AddressType::P2SH: {
            auto p2sh = Pay2SHAddress::create(std::move(content));
            if (!p2sh) {
                return std::unexpected(p2sh.error());
            }
            return std::move(*p2sh);
        }

        case AddressType::P2S:
            return Pay2SAddress(std::move(content));
    }

    return Err<Address>(ErrorCode::AddressUnsupportedType);
}

std::string to_string(const Address& address, const AddressEncoder& encoder) {
    return encoder.encode(address);
}

} // namespace ergo::address
