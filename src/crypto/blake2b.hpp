/**
 * @file blake2b.hpp
 * @brief Blake2b-256 интерфейс
 *
 * Хеш-функция, используемая в адресах Ergo:
 * - Контрольная сумма адреса: первые 4 байта Blake2b-256
 * - Содержимое P2SH адреса: первые 24 байта Blake2b-256 от скрипта
 *
 * Реализация соответствует RFC 7693 (без ключа, длина вывода 32 байта).
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <cstdint>

namespace ergo::crypto {

/**
 * @brief Blake2b состояние (8 x 64-bit слов)
 */
using Blake2bState = std::array<uint64_t, 8>;

/**
 * @brief Вычислить Blake2b-256 хеш данных произвольной длины
 *
 * @param data Входные данные для хеширования
 * @return Hash256 32-байтный хеш
 */
[[nodiscard]] Hash256 blake2b256(ByteSpan data) noexcept;

/**
 * @brief Вычислить 192-битный хеш (первые 24 байта Blake2b-256)
 *
 * Используется для получения содержимого Pay-to-Script-Hash адреса
 * из сериализованного скрипта.
 *
 * @param data Входные данные для хеширования
 * @return Hash192 24-байтный хеш
 */
[[nodiscard]] Hash192 hash192(ByteSpan data) noexcept;

/**
 * @brief Функция сжатия Blake2b для одного 128-байтного блока
 *
 * @param state Текущее состояние хеша (будет модифицировано)
 * @param block Указатель на 128 байт данных
 * @param counter Количество байт, обработанных с учётом этого блока
 * @param last true для последнего блока сообщения
 *
 * @warning block должен содержать ровно 128 байт!
 */
void blake2b_compress(
    Blake2bState& state,
    const uint8_t* block,
    uint64_t counter,
    bool last
) noexcept;

} // namespace ergo::crypto
