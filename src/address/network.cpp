/**
 * @file network.cpp
 * @brief Разбор и отображение префиксов сетей
 */

#include "network.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <string>

namespace ergo::address {

std::string_view network_name(uint8_t prefix) noexcept {
    switch (prefix) {
        case constants::MAINNET_PREFIX: return "mainnet";
        case constants::TESTNET_PREFIX: return "testnet";
        default: return "custom";
    }
}

Result<uint8_t> parse_network(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "mainnet" || lower == "main") {
        return constants::MAINNET_PREFIX;
    }
    if (lower == "testnet" || lower == "test") {
        return constants::TESTNET_PREFIX;
    }

    // Произвольный байт
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(lower.data(), lower.data() + lower.size(), value);
    if (lower.empty() || ec != std::errc{} || ptr != lower.data() + lower.size() || value > 0xFF) {
        return Err<uint8_t>(
            ErrorCode::ConfigInvalidValue,
            std::format("Неизвестная сеть '{}' (ожидается mainnet, testnet или 0..255)", name)
        );
    }

    return static_cast<uint8_t>(value);
}

} // namespace ergo::address
