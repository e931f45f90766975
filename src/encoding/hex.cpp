/**
 * @file hex.cpp
 * @brief Реализация hex кодирования
 */

#include "hex.hpp"

#include <format>
#include <iomanip>
#include <sstream>

namespace ergo::encoding {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string to_hex(ByteSpan data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : data) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

Result<Bytes> from_hex(std::string_view hex) {
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }

    if (hex.size() % 2 != 0) {
        return Err<Bytes>(
            ErrorCode::EncodingInvalidHex,
            std::format("Нечётная длина hex строки: {}", hex.size())
        );
    }

    Bytes result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_value(hex[i]);
        int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return Err<Bytes>(
                ErrorCode::EncodingInvalidHex,
                std::format("Недопустимый hex символ в позиции {}", high < 0 ? i : i + 1)
            );
        }
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return result;
}

} // namespace ergo::encoding
