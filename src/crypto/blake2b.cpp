/**
 * @file blake2b.cpp
 * @brief Реализация Blake2b-256
 *
 * Разбиение сообщения на блоки и финализация. Функция сжатия
 * находится в blake2b_generic.cpp.
 */

#include "blake2b.hpp"
#include "../core/byte_order.hpp"

#include <algorithm>
#include <cstring>

namespace ergo::crypto {

namespace {

/**
 * @brief Параметрический блок: digest_length = 32, key_length = 0,
 *        fanout = 1, depth = 1
 */
constexpr uint64_t PARAM_WORD0 = 0x01010000ULL | constants::BLAKE2B256_SIZE;

} // anonymous namespace

Hash256 blake2b256(ByteSpan data) noexcept {
    constexpr std::size_t BLOCK = constants::BLAKE2B_BLOCK_SIZE;

    // Начальное состояние
    Blake2bState state = constants::BLAKE2B_IV;
    state[0] ^= PARAM_WORD0;

    const auto len = data.size();
    const uint8_t* ptr = data.data();

    // Все блоки, кроме последнего. Последний блок обрабатывается с флагом
    // финализации, даже если он полный.
    uint64_t counter = 0;
    std::size_t remaining = len;
    while (remaining > BLOCK) {
        counter += BLOCK;
        blake2b_compress(state, ptr, counter, false);
        ptr += BLOCK;
        remaining -= BLOCK;
    }

    // Последний блок, дополненный нулями
    std::array<uint8_t, BLOCK> buffer{};
    if (remaining > 0) {
        std::memcpy(buffer.data(), ptr, remaining);
    }
    counter += remaining;
    blake2b_compress(state, buffer.data(), counter, true);

    // Первые 4 слова состояния в little-endian
    Hash256 result;
    for (std::size_t i = 0; i < 4; ++i) {
        write_le64(result.data() + i * 8, state[i]);
    }

    return result;
}

Hash192 hash192(ByteSpan data) noexcept {
    const Hash256 full = blake2b256(data);

    Hash192 result;
    std::copy_n(full.begin(), result.size(), result.begin());
    return result;
}

} // namespace ergo::crypto
