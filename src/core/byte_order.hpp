/**
 * @file byte_order.hpp
 * @brief Функции для работы с порядком байт (endianness)
 *
 * Blake2b оперирует 64-битными словами в little-endian порядке.
 * Эти функции читают и записывают слова независимо от порядка байт хоста.
 *
 * @note Все функции помечены noexcept так как не выбрасывают исключений.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <bit>
#include <concepts>

namespace ergo {

/**
 * @brief Concept для целочисленных типов фиксированного размера
 */
template<typename T>
concept UnsignedInteger = std::unsigned_integral<T> &&
                          (sizeof(T) == 1 || sizeof(T) == 2 ||
                           sizeof(T) == 4 || sizeof(T) == 8);

/**
 * @brief Проверка: система little-endian?
 */
[[nodiscard]] consteval bool is_little_endian() noexcept {
    return std::endian::native == std::endian::little;
}

/**
 * @brief Поменять порядок байт (byte swap)
 *
 * @tparam T Тип целого числа (uint16_t, uint32_t, uint64_t)
 * @param value Значение для преобразования
 * @return Значение с обратным порядком байт
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T byte_swap(T value) noexcept {
    if constexpr (sizeof(T) == 1) {
        return value;
    } else {
        T result = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            result = static_cast<T>((result << 8) | (value & 0xFF));
            value = static_cast<T>(value >> 8);
        }
        return result;
    }
}

/**
 * @brief Преобразовать число из формата хоста в little-endian
 *
 * На little-endian системах (x86) - ничего не делает.
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T to_little_endian(T value) noexcept {
    if constexpr (is_little_endian()) {
        return value;
    } else {
        return byte_swap(value);
    }
}

/**
 * @brief Преобразовать число из little-endian в формат хоста
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T from_little_endian(T value) noexcept {
    return to_little_endian(value); // Симметричная операция
}

/**
 * @brief Записать uint64_t в little-endian формате
 *
 * @param dest Указатель на буфер (минимум 8 байт)
 * @param value Значение для записи
 */
inline void write_le64(uint8_t* dest, uint64_t value) noexcept {
    value = to_little_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

/**
 * @brief Прочитать uint64_t из little-endian буфера
 *
 * @param src Указатель на буфер (минимум 8 байт)
 * @return Значение в формате хоста
 */
[[nodiscard]] inline uint64_t read_le64(const uint8_t* src) noexcept {
    uint64_t value;
    std::memcpy(&value, src, sizeof(value));
    return from_little_endian(value);
}

} // namespace ergo
