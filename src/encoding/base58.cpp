/**
 * @file base58.cpp
 * @brief Реализация Base58 кодирования
 *
 * Число хранится как big-endian массив цифр, деление и умножение
 * на 58 выполняются "в столбик". Сложность O(n^2), что достаточно
 * для адресов длиной до нескольких сотен байт.
 */

#include "base58.hpp"

#include <algorithm>
#include <array>
#include <format>

namespace ergo::encoding {

namespace {

/// @brief Обратная таблица: символ -> значение цифры, -1 для недопустимых
constexpr std::array<int8_t, 128> make_decode_table() noexcept {
    std::array<int8_t, 128> table{};
    table.fill(-1);
    for (std::size_t i = 0; i < BASE58_ALPHABET.size(); ++i) {
        table[static_cast<std::size_t>(BASE58_ALPHABET[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto DECODE_TABLE = make_decode_table();

/**
 * @brief Значение символа Base58 или -1
 */
int decode_char(char c) noexcept {
    auto index = static_cast<unsigned char>(c);
    if (index >= DECODE_TABLE.size()) {
        return -1;
    }
    return DECODE_TABLE[index];
}

} // anonymous namespace

std::string base58_encode(ByteSpan data) {
    if (data.empty()) {
        return {};
    }

    // Ведущие нули
    std::size_t leading_zeros = 0;
    while (leading_zeros < data.size() && data[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // Цифры по основанию 58, младшая цифра в конце
    // log(256) / log(58) ~ 1.37
    std::vector<uint8_t> digits((data.size() - leading_zeros) * 138 / 100 + 1, 0);
    std::size_t length = 0;

    for (std::size_t i = leading_zeros; i < data.size(); ++i) {
        uint32_t carry = data[i];
        std::size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += static_cast<uint32_t>(*it) << 8;
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    // Пропускаем ведущие нули в цифрах
    auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string result;
    result.reserve(leading_zeros + static_cast<std::size_t>(digits.end() - it));
    result.assign(leading_zeros, '1');
    for (; it != digits.end(); ++it) {
        result.push_back(BASE58_ALPHABET[*it]);
    }

    return result;
}

Result<Bytes> base58_decode(std::string_view str) {
    if (str.empty()) {
        return Err<Bytes>(
            ErrorCode::AddressMalformedEncoding,
            "Пустая Base58 строка"
        );
    }

    // Ведущие '1'
    std::size_t leading_ones = 0;
    while (leading_ones < str.size() && str[leading_ones] == '1') {
        ++leading_ones;
    }

    // Байты числа, младший байт в конце
    // log(58) / log(256) ~ 0.733
    std::vector<uint8_t> bytes((str.size() - leading_ones) * 733 / 1000 + 1, 0);
    std::size_t length = 0;

    for (std::size_t i = leading_ones; i < str.size(); ++i) {
        int digit = decode_char(str[i]);
        if (digit < 0) {
            return Err<Bytes>(
                ErrorCode::AddressMalformedEncoding,
                std::format("Недопустимый символ Base58 '{}' в позиции {}", str[i], i)
            );
        }

        uint32_t carry = static_cast<uint32_t>(digit);
        std::size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += static_cast<uint32_t>(*it) * 58;
            *it = static_cast<uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        length = j;
    }

    auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - length);
    while (it != bytes.end() && *it == 0) {
        ++it;
    }

    Bytes result;
    result.reserve(leading_ones + static_cast<std::size_t>(bytes.end() - it));
    result.assign(leading_ones, 0);
    result.insert(result.end(), it, bytes.end());

    return result;
}

bool is_base58(std::string_view str) noexcept {
    return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) {
        return decode_char(c) >= 0;
    });
}

} // namespace ergo::encoding
