/**
 * @file constants.hpp
 * @brief Константы формата адресов Ergo
 *
 * Содержит размеры, префиксы сетей и коды типов адресов.
 * Все значения являются частью формата передачи и не могут
 * меняться без потери совместимости с уже выпущенными адресами.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <array>

namespace ergo::constants {

// =============================================================================
// Размеры
// =============================================================================

/// @brief Размер Blake2b-256 хеша в байтах
inline constexpr std::size_t BLAKE2B256_SIZE = 32;

/// @brief Размер блока Blake2b (одна компрессия) в байтах
inline constexpr std::size_t BLAKE2B_BLOCK_SIZE = 128;

/// @brief Длина контрольной суммы в закодированном адресе
inline constexpr std::size_t CHECKSUM_LENGTH = 4;

/// @brief Длина содержимого P2SH адреса (192-битный хеш скрипта)
inline constexpr std::size_t SCRIPT_HASH_LENGTH = 24;

/// @brief Минимальная длина декодированного адреса: байт префикса + checksum
inline constexpr std::size_t MIN_ENCODED_LENGTH = 1 + CHECKSUM_LENGTH;

// =============================================================================
// Префиксы сетей
// =============================================================================

/// @brief Префикс mainnet
inline constexpr uint8_t MAINNET_PREFIX = 0x00;

/// @brief Префикс testnet
inline constexpr uint8_t TESTNET_PREFIX = 0x10;

/**
 * @brief Граница между диапазонами mainnet и testnet
 *
 * Байт заголовка mainnet адреса строго меньше границы,
 * testnet адреса строго больше.
 */
inline constexpr uint8_t TESTNET_THRESHOLD = TESTNET_PREFIX;

static_assert(TESTNET_PREFIX == MAINNET_PREFIX + 16);

// =============================================================================
// Типы адресов
// =============================================================================

/// @brief Pay-to-PublicKey
inline constexpr uint8_t P2PK_TYPE = 0x01;

/// @brief Pay-to-Script-Hash
inline constexpr uint8_t P2SH_TYPE = 0x02;

/// @brief Pay-to-Script
inline constexpr uint8_t P2S_TYPE = 0x03;

// =============================================================================
// Константы Blake2b (RFC 7693)
// =============================================================================

/// @brief Начальный вектор (совпадает с IV SHA-512)
inline constexpr std::array<uint64_t, 8> BLAKE2B_IV = {
    0x6a09e667f3bcc908ULL, 0xbb67ae8584caa73bULL,
    0x3c6ef372fe94f82bULL, 0xa54ff53a5f1d36f1ULL,
    0x510e527fade682d1ULL, 0x9b05688c2b3e6c1fULL,
    0x1f83d9abfb41bd6bULL, 0x5be0cd19137e2179ULL
};

/// @brief Таблица перестановок слов сообщения для 12 раундов
inline constexpr std::array<std::array<uint8_t, 16>, 12> BLAKE2B_SIGMA = {{
    {  0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14, 15 },
    { 14, 10,  4,  8,  9, 15, 13,  6,  1, 12,  0,  2, 11,  7,  5,  3 },
    { 11,  8, 12,  0,  5,  2, 15, 13, 10, 14,  3,  6,  7,  1,  9,  4 },
    {  7,  9,  3,  1, 13, 12, 11, 14,  2,  6,  5, 10,  4,  0, 15,  8 },
    {  9,  0,  5,  7,  2,  4, 10, 15, 14,  1, 11, 12,  6,  8,  3, 13 },
    {  2, 12,  6, 10,  0, 11,  8,  3,  4, 13,  7,  5, 15, 14,  1,  9 },
    { 12,  5,  1, 15, 14, 13,  4, 10,  0,  7,  6,  3,  9,  2,  8, 11 },
    { 13, 11,  7, 14, 12,  1,  3,  9,  5,  0, 15,  4,  8,  6,  2, 10 },
    {  6, 15, 14,  9, 11,  3,  0,  8, 12,  2, 13,  7,  1,  4, 10,  5 },
    { 10,  2,  8,  4,  7,  6,  1,  5, 15, 11,  9, 14,  3, 12, 13,  0 },
    {  0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14, 15 },
    { 14, 10,  4,  8,  9, 15, 13,  6,  1, 12,  0,  2, 11,  7,  5,  3 },
}};

// =============================================================================
// Константы CLI
// =============================================================================

/// @brief Имя конфигурационного файла по умолчанию
inline constexpr const char* DEFAULT_CONFIG_FILE = "ergo-address.toml";

} // namespace ergo::constants
