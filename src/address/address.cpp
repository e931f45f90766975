/**
 * @file address.cpp
 * @brief Реализация модели адресов
 */

#include "address.hpp"
#include "../crypto/blake2b.hpp"

#include <format>

namespace ergo::address {

std::string_view type_name(AddressType type) noexcept {
    switch (type) {
        case AddressType::P2PK: return "P2PK";
        case AddressType::P2SH: return "P2SH";
        case AddressType::P2S: return "P2S";
    }
    return "unknown";
}

std::optional<AddressType> address_type_from_byte(uint8_t value) noexcept {
    switch (value) {
        case constants::P2PK_TYPE: return AddressType::P2PK;
        case constants::P2SH_TYPE: return AddressType::P2SH;
        case constants::P2S_TYPE: return AddressType::P2S;
        default: return std::nullopt;
    }
}

// =============================================================================
// Pay2SHAddress
// =============================================================================

Result<Pay2SHAddress> Pay2SHAddress::create(Bytes script_hash) {
    if (script_hash.size() != constants::SCRIPT_HASH_LENGTH) {
        return Err<Pay2SHAddress>(
            ErrorCode::AddressInvalidContentLength,
            std::format("Длина хеша скрипта P2SH: {} (ожидается {})",
                        script_hash.size(), constants::SCRIPT_HASH_LENGTH)
        );
    }
    return Pay2SHAddress(std::move(script_hash));
}

Pay2SHAddress Pay2SHAddress::from_hash(const Hash192& script_hash) {
    return Pay2SHAddress(Bytes(script_hash.begin(), script_hash.end()));
}

Pay2SHAddress Pay2SHAddress::from_script(ByteSpan script) {
    return from_hash(crypto::hash192(script));
}

// =============================================================================
// Функции над Address
// =============================================================================

AddressType type_tag(const Address& address) noexcept {
    return std::visit([](const auto& a) { return a.type_tag(); }, address);
}

const Bytes& content_bytes(const Address& address) noexcept {
    return std::visit([](const auto& a) -> const Bytes& { return a.content_bytes(); }, address);
}

bool is_p2pk(const Address& address) noexcept {
    return std::holds_alternative<P2PKAddress>(address);
}

} // namespace ergo::address
