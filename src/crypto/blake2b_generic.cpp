/**
 * @file blake2b_generic.cpp
 * @brief Программная реализация функции сжатия Blake2b
 *
 * Алгоритм соответствует RFC 7693, секция 3.2.
 */

#include "blake2b.hpp"
#include "../core/byte_order.hpp"
#include "../core/constants.hpp"

#include <bit>

namespace ergo::crypto {

// =============================================================================
// Вспомогательные макросы Blake2b
// =============================================================================

#define ROTR64(x, n) std::rotr(x, n)

/**
 * @brief Функция смешивания G (RFC 7693, секция 3.1)
 *
 * @param a-d Индексы рабочих переменных
 * @param x, y Слова сообщения
 */
#define BLAKE2B_G(a, b, c, d, x, y) \
    do { \
        v[a] = v[a] + v[b] + (x); \
        v[d] = ROTR64(v[d] ^ v[a], 32); \
        v[c] = v[c] + v[d]; \
        v[b] = ROTR64(v[b] ^ v[c], 24); \
        v[a] = v[a] + v[b] + (y); \
        v[d] = ROTR64(v[d] ^ v[a], 16); \
        v[c] = v[c] + v[d]; \
        v[b] = ROTR64(v[b] ^ v[c], 63); \
    } while (0)

// =============================================================================
// Blake2b Compress
// =============================================================================

/**
 * @brief Функция сжатия Blake2b
 *
 * Алгоритм:
 * 1. Чтение 16 слов сообщения (little-endian)
 * 2. Инициализация рабочего вектора v[0..15]
 * 3. 12 раундов смешивания
 * 4. XOR двух половин v в состояние
 */
void blake2b_compress(
    Blake2bState& state,
    const uint8_t* block,
    uint64_t counter,
    bool last
) noexcept {
    // === Шаг 1: Слова сообщения ===
    uint64_t m[16];
    for (std::size_t i = 0; i < 16; ++i) {
        m[i] = read_le64(block + i * 8);
    }

    // === Шаг 2: Рабочий вектор ===
    uint64_t v[16];
    for (std::size_t i = 0; i < 8; ++i) {
        v[i] = state[i];
        v[i + 8] = constants::BLAKE2B_IV[i];
    }

    // Старшие 64 бита счётчика всегда 0: входы короче 2^64 байт
    v[12] ^= counter;

    if (last) {
        v[14] = ~v[14];
    }

    // === Шаг 3: 12 раундов ===
    for (std::size_t round = 0; round < 12; ++round) {
        const auto& s = constants::BLAKE2B_SIGMA[round];

        // Столбцы
        BLAKE2B_G(0, 4,  8, 12, m[s[0]],  m[s[1]]);
        BLAKE2B_G(1, 5,  9, 13, m[s[2]],  m[s[3]]);
        BLAKE2B_G(2, 6, 10, 14, m[s[4]],  m[s[5]]);
        BLAKE2B_G(3, 7, 11, 15, m[s[6]],  m[s[7]]);

        // Диагонали
        BLAKE2B_G(0, 5, 10, 15, m[s[8]],  m[s[9]]);
        BLAKE2B_G(1, 6, 11, 12, m[s[10]], m[s[11]]);
        BLAKE2B_G(2, 7,  8, 13, m[s[12]], m[s[13]]);
        BLAKE2B_G(3, 4,  9, 14, m[s[14]], m[s[15]]);
    }

    // === Шаг 4: Добавление к состоянию ===
    for (std::size_t i = 0; i < 8; ++i) {
        state[i] ^= v[i] ^ v[i + 8];
    }
}

// Очистка макросов
#undef ROTR64
#undef BLAKE2B_G

} // namespace ergo::crypto
