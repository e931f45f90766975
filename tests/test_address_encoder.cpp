/**
 * @file test_address_encoder.cpp
 * @brief Тесты кодирования и декодирования адресов Ergo
 *
 * Векторы взяты из опубликованных mainnet и testnet адресов.
 */

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "address/encoder.hpp"
#include "crypto/blake2b.hpp"
#include "encoding/base58.hpp"
#include "encoding/hex.hpp"

namespace ergo::tests {

using namespace ergo::address;

namespace {

/// @brief Mainnet P2PK адрес
constexpr const char* MAINNET_P2PK = "9fRAWhdxEsTcdb8PhGNrZfwqa65zfkuYHAMmkQLcic1gdLSV5vA";
constexpr const char* MAINNET_P2PK_CONTENT =
    "02764ea2b0b9b06b5730a4257bba71fd7797eb1ec12bc3ae6025a01d7fba53830e";

/// @brief Ещё один mainnet P2PK адрес
constexpr const char* MAINNET_P2PK_SECOND = "9eYPzx6nogBjex83aiGemfdj579qxD3TPRiPRNHyLZRG8S7rLuQ";

/// @brief Testnet P2PK адрес
constexpr const char* TESTNET_P2PK = "3WvsT2Gm4EpsM9Pg18PdY6XyhNNMqXDsvJTbbf6ihLvAmSb7u5RN";

/// @brief P2SH адреса с одинаковым хешем скрипта
constexpr const char* MAINNET_P2SH = "8UApt8czfFVuTgQmMwtsRBZ4nfWquNiSwCWUjMg";
constexpr const char* TESTNET_P2SH = "rbcrmKEYduUvADj9Ts3dSVSG27h54pgrq5fPuwB";
constexpr const char* P2SH_CONTENT = "d62151f990f191c102a6fe995b89ed3d0f343a96f13789a3";

/// @brief P2S адреса с одинаковым скриптом
constexpr const char* MAINNET_P2S = "4MQyML64GnzMxZgm";
constexpr const char* TESTNET_P2S = "Ms7smJwLGbUAjuWQ";
constexpr const char* P2S_CONTENT = "10010101d17300";

Bytes hex(std::string_view text) {
    auto result = encoding::from_hex(text);
    EXPECT_TRUE(result.has_value());
    return result.value_or(Bytes{});
}

/**
 * @brief Собрать закодированный адрес с произвольным заголовком и верной суммой
 */
std::string encode_raw(uint8_t head_byte, const Bytes& content) {
    Bytes payload;
    payload.push_back(head_byte);
    payload.insert(payload.end(), content.begin(), content.end());
    const auto hash = crypto::blake2b256(payload);
    payload.insert(payload.end(), hash.begin(), hash.begin() + 4);
    return encoding::base58_encode(payload);
}

ErrorCode decode_error(const AddressEncoder& encoder, std::string_view text) {
    auto result = encoder.decode(text);
    EXPECT_FALSE(result.has_value()) << text;
    return result ? ErrorCode::Success : result.error().code;
}

} // anonymous namespace

/**
 * @brief Класс тестов кодировщика
 */
class AddressEncoderTest : public ::testing::Test {
protected:
    const AddressEncoder mainnet_ = AddressEncoder::mainnet();
    const AddressEncoder testnet_ = AddressEncoder::testnet();
};

// =============================================================================
// Конструкторы
// =============================================================================

TEST_F(AddressEncoderTest, NamedConstructors) {
    EXPECT_EQ(mainnet_.network_prefix(), 0);
    EXPECT_EQ(testnet_.network_prefix(), 16);
    EXPECT_EQ(AddressEncoder(uint8_t{16}).network_prefix(), testnet_.network_prefix());
    EXPECT_EQ(AddressEncoder(NetworkPrefix::Testnet).network_prefix(), 16);
}

TEST_F(AddressEncoderTest, HeadBytePredicates) {
    EXPECT_TRUE(AddressEncoder::is_mainnet_address(0x01));
    EXPECT_TRUE(AddressEncoder::is_mainnet_address(0x0F));
    EXPECT_FALSE(AddressEncoder::is_mainnet_address(0x10));
    EXPECT_FALSE(AddressEncoder::is_testnet_address(0x10));
    EXPECT_TRUE(AddressEncoder::is_testnet_address(0x11));
    EXPECT_FALSE(AddressEncoder::is_testnet_address(0x03));

    // Байт заголовка знаковый: 0x80..0xFF меньше порога
    EXPECT_TRUE(AddressEncoder::is_mainnet_address(0x83));
    EXPECT_TRUE(AddressEncoder::is_mainnet_address(0xFF));
    EXPECT_FALSE(AddressEncoder::is_testnet_address(0x93));
    EXPECT_FALSE(AddressEncoder::is_testnet_address(0x80));
    EXPECT_TRUE(AddressEncoder::is_testnet_address(0x7F));
}

// =============================================================================
// Известные векторы
// =============================================================================

/**
 * @brief Тест: mainnet P2PK адрес декодируется и кодируется обратно
 */
TEST_F(AddressEncoderTest, KnownMainnetP2PK) {
    auto decoded = mainnet_.decode(MAINNET_P2PK);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;

    ASSERT_TRUE(is_p2pk(*decoded));
    EXPECT_EQ(content_bytes(*decoded).size(), 33u);
    EXPECT_EQ(encoding::to_hex(content_bytes(*decoded)), MAINNET_P2PK_CONTENT);

    EXPECT_EQ(mainnet_.encode(*decoded), MAINNET_P2PK);
    EXPECT_EQ(to_string(*decoded, mainnet_), MAINNET_P2PK);
}

TEST_F(AddressEncoderTest, SecondMainnetP2PK) {
    auto decoded = mainnet_.decode(MAINNET_P2PK_SECOND);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_TRUE(is_p2pk(*decoded));
    EXPECT_EQ(mainnet_.encode(*decoded), MAINNET_P2PK_SECOND);

    EXPECT_EQ(decode_error(testnet_, MAINNET_P2PK_SECOND), ErrorCode::AddressNetworkMismatch);
}

TEST_F(AddressEncoderTest, KnownTestnetP2PK) {
    auto decoded = testnet_.decode(TESTNET_P2PK);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_TRUE(is_p2pk(*decoded));
    EXPECT_EQ(testnet_.encode(*decoded), TESTNET_P2PK);
}

TEST_F(AddressEncoderTest, KnownP2SH) {
    const Address expected = *Pay2SHAddress::create(hex(P2SH_CONTENT));

    auto on_main = mainnet_.decode(MAINNET_P2SH);
    ASSERT_TRUE(on_main.has_value()) << on_main.error().message;
    EXPECT_EQ(*on_main, expected);

    auto on_test = testnet_.decode(TESTNET_P2SH);
    ASSERT_TRUE(on_test.has_value()) << on_test.error().message;
    EXPECT_EQ(*on_test, expected);

    EXPECT_EQ(mainnet_.encode(expected), MAINNET_P2SH);
    EXPECT_EQ(testnet_.encode(expected), TESTNET_P2SH);
}

TEST_F(AddressEncoderTest, KnownP2S) {
    const Address expected = Pay2SAddress(hex(P2S_CONTENT));

    EXPECT_EQ(mainnet_.encode(expected), MAINNET_P2S);
    EXPECT_EQ(testnet_.encode(expected), TESTNET_P2S);

    auto on_main = mainnet_.decode(MAINNET_P2S);
    ASSERT_TRUE(on_main.has_value()) << on_main.error().message;
    EXPECT_EQ(*on_main, expected);
}

// =============================================================================
// Round-trip
// =============================================================================

TEST_F(AddressEncoderTest, RoundTripAllVariantsBothNetworks) {
    std::vector<Address> addresses;
    addresses.emplace_back(P2PKAddress(Bytes(33, 0x03)));
    addresses.emplace_back(P2PKAddress(Bytes{0x00, 0x00, 0x01}));
    addresses.emplace_back(Pay2SHAddress::from_script(Bytes{0xAA, 0xBB}));
    addresses.emplace_back(Pay2SAddress(Bytes(300, 0x5A)));

    for (const auto& encoder : {mainnet_, testnet_}) {
        for (const auto& address : addresses) {
            const auto text = encoder.encode(address);
            auto decoded = encoder.decode(text);
            ASSERT_TRUE(decoded.has_value()) << text << ": " << decoded.error().message;
            EXPECT_EQ(*decoded, address) << text;
        }
    }
}

/**
 * @brief Тест: префикс и тип складываются в один байт заголовка
 */
TEST_F(AddressEncoderTest, HeaderByteIsPrefixPlusType) {
    const Address p2s = Pay2SAddress(Bytes{0x01});

    auto main_bytes = encoding::base58_decode(mainnet_.encode(p2s));
    auto test_bytes = encoding::base58_decode(testnet_.encode(p2s));
    ASSERT_TRUE(main_bytes.has_value());
    ASSERT_TRUE(test_bytes.has_value());

    EXPECT_EQ(main_bytes->front(), 0x03);
    EXPECT_EQ(test_bytes->front(), 0x13);
    EXPECT_EQ(main_bytes->size(), 1u + 1u + 4u);
}

/**
 * @brief Тест: заголовок для произвольного префикса вычисляется по модулю 256
 */
TEST_F(AddressEncoderTest, CustomPrefixWrapsModulo256) {
    const AddressEncoder custom(uint8_t{0xFE});
    const Address p2s = Pay2SAddress(Bytes{0x01});

    auto bytes = encoding::base58_decode(custom.encode(p2s));
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(bytes->front(), 0x01);
}

TEST_F(AddressEncoderTest, CustomPrefixRoundTrip) {
    const AddressEncoder custom(uint8_t{0x20});
    const Address p2pk = P2PKAddress(Bytes(33, 0x02));

    auto decoded = custom.decode(custom.encode(p2pk));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(*decoded, p2pk);
}

// =============================================================================
// Ошибки декодирования
// =============================================================================

TEST_F(AddressEncoderTest, EmptyStringIsMalformed) {
    EXPECT_EQ(decode_error(mainnet_, ""), ErrorCode::AddressMalformedEncoding);
    EXPECT_EQ(decode_error(testnet_, ""), ErrorCode::AddressMalformedEncoding);
}

TEST_F(AddressEncoderTest, InvalidAlphabetIsMalformed) {
    EXPECT_EQ(decode_error(mainnet_, "9fRAWhdxEsTcdb8PhGNrZfwqa65zfkuYHAMmkQLcic1gdLSV5v0"),
              ErrorCode::AddressMalformedEncoding);
    EXPECT_EQ(decode_error(mainnet_, "not an address"), ErrorCode::AddressMalformedEncoding);
}

/**
 * @brief Тест: валидный Base58, но меньше 5 байт
 */
TEST_F(AddressEncoderTest, TooShort) {
    // 4 символа Base58 всегда дают не больше 4 байт
    EXPECT_EQ(decode_error(mainnet_, "2222"), ErrorCode::AddressTooShort);
    EXPECT_EQ(decode_error(mainnet_, "1111"), ErrorCode::AddressTooShort);
    EXPECT_EQ(decode_error(testnet_, "zzzz"), ErrorCode::AddressTooShort);
    EXPECT_EQ(decode_error(mainnet_, encoding::base58_encode(Bytes{1, 2, 3, 4})),
              ErrorCode::AddressTooShort);
}

TEST_F(AddressEncoderTest, MinimalPayloadDecodesToEmptyContent) {
    auto decoded = mainnet_.decode(encode_raw(0x01, Bytes{}));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_TRUE(is_p2pk(*decoded));
    EXPECT_TRUE(content_bytes(*decoded).empty());
}

/**
 * @brief Тест: изоляция сетей в обе стороны
 */
TEST_F(AddressEncoderTest, NetworkIsolation) {
    EXPECT_EQ(decode_error(testnet_, MAINNET_P2PK), ErrorCode::AddressNetworkMismatch);
    EXPECT_EQ(decode_error(testnet_, MAINNET_P2SH), ErrorCode::AddressNetworkMismatch);
    EXPECT_EQ(decode_error(testnet_, MAINNET_P2S), ErrorCode::AddressNetworkMismatch);

    EXPECT_EQ(decode_error(mainnet_, TESTNET_P2PK), ErrorCode::AddressNetworkMismatch);
    EXPECT_EQ(decode_error(mainnet_, TESTNET_P2SH), ErrorCode::AddressNetworkMismatch);
    EXPECT_EQ(decode_error(mainnet_, TESTNET_P2S), ErrorCode::AddressNetworkMismatch);
}

/**
 * @brief Тест: заголовок 0x10 не принадлежит ни одной сети
 */
TEST_F(AddressEncoderTest, ThresholdHeadByteRejectedByBoth) {
    const auto text = encode_raw(0x10, Bytes(10, 0x01));
    EXPECT_EQ(decode_error(mainnet_, text), ErrorCode::AddressNetworkMismatch);
    EXPECT_EQ(decode_error(testnet_, text), ErrorCode::AddressNetworkMismatch);
}

TEST_F(AddressEncoderTest, UnsupportedType) {
    EXPECT_EQ(decode_error(mainnet_, encode_raw(0x00, Bytes(10, 0x01))),
              ErrorCode::AddressUnsupportedType);
    EXPECT_EQ(decode_error(mainnet_, encode_raw(0x04, Bytes(10, 0x01))),
              ErrorCode::AddressUnsupportedType);
    EXPECT_EQ(decode_error(mainnet_, encode_raw(0x0F, Bytes(10, 0x01))),
              ErrorCode::AddressUnsupportedType);
    EXPECT_EQ(decode_error(testnet_, encode_raw(0x15, Bytes(10, 0x01))),
              ErrorCode::AddressUnsupportedType);

    auto result = mainnet_.decode(encode_raw(0x04, Bytes(10, 0x01)));
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find('4'), std::string::npos);
}

/**
 * @brief Тест: заголовки 0x80..0xFF
 *
 * Для mainnet такой байт отрицателен, проходит проверку сети и
 * отклоняется как тип со знаковым значением. Для testnet он не
 * превышает порог и отклоняется как адрес другой сети.
 */
TEST_F(AddressEncoderTest, HighHeadBytes) {
    auto on_main = mainnet_.decode(encode_raw(0x83, Bytes(10, 0x01)));
    ASSERT_FALSE(on_main.has_value());
    EXPECT_EQ(on_main.error().code, ErrorCode::AddressUnsupportedType);
    EXPECT_NE(on_main.error().message.find("-125"), std::string::npos)
        << on_main.error().message;

    EXPECT_EQ(decode_error(mainnet_, encode_raw(0xFF, Bytes(10, 0x01))),
              ErrorCode::AddressUnsupportedType);

    EXPECT_EQ(decode_error(testnet_, encode_raw(0x93, Bytes(10, 0x01))),
              ErrorCode::AddressNetworkMismatch);
    EXPECT_EQ(decode_error(testnet_, encode_raw(0x80, Bytes(10, 0x01))),
              ErrorCode::AddressNetworkMismatch);
}

/**
 * @brief Тест: кодировщик с префиксом 0x80..0xFF читает свои адреса
 */
TEST_F(AddressEncoderTest, NegativeCustomPrefixRoundTrip) {
    const AddressEncoder custom(uint8_t{0xFE});
    const Address p2s = Pay2SAddress(Bytes{0x01, 0x02});

    auto decoded = custom.decode(custom.encode(p2s));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(*decoded, p2s);
}

TEST_F(AddressEncoderTest, ScriptHashContentLength) {
    EXPECT_EQ(decode_error(mainnet_, encode_raw(0x02, Bytes(23, 0x01))),
              ErrorCode::AddressInvalidContentLength);
    EXPECT_EQ(decode_error(testnet_, encode_raw(0x12, Bytes(25, 0x01))),
              ErrorCode::AddressInvalidContentLength);
    EXPECT_EQ(decode_error(mainnet_, encode_raw(0x02, Bytes{})),
              ErrorCode::AddressInvalidContentLength);
}

TEST_F(AddressEncoderTest, ChecksumMismatch) {
    auto bytes = encoding::base58_decode(MAINNET_P2PK);
    ASSERT_TRUE(bytes.has_value());

    bytes->back() ^= 0x01;
    EXPECT_EQ(decode_error(mainnet_, encoding::base58_encode(*bytes)),
              ErrorCode::AddressChecksumMismatch);
}

/**
 * @brief Тест: инверсия любого бита в содержимом или сумме ломает адрес
 *
 * Байт заголовка не затрагивается: его порча даёт ошибку сети или типа
 * до проверки суммы.
 */
TEST_F(AddressEncoderTest, SingleBitFlipDetected) {
    auto original = encoding::base58_decode(MAINNET_P2PK);
    ASSERT_TRUE(original.has_value());

    for (std::size_t i = 1; i < original->size(); ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            Bytes corrupted = *original;
            corrupted[i] ^= static_cast<uint8_t>(1u << bit);

            auto result = mainnet_.decode(encoding::base58_encode(corrupted));
            ASSERT_FALSE(result.has_value()) << "byte " << i << " bit " << bit;
            EXPECT_TRUE(result.error().code == ErrorCode::AddressChecksumMismatch ||
                        result.error().code == ErrorCode::AddressMalformedEncoding)
                << "byte " << i << " bit " << bit << ": " << result.error().message;
        }
    }
}

TEST_F(AddressEncoderTest, HeadByteFlipNeverDecodes) {
    auto original = encoding::base58_decode(MAINNET_P2PK);
    ASSERT_TRUE(original.has_value());

    for (int bit = 0; bit < 8; ++bit) {
        Bytes corrupted = *original;
        corrupted[0] ^= static_cast<uint8_t>(1u << bit);
        EXPECT_FALSE(mainnet_.decode(encoding::base58_encode(corrupted)).has_value()) << bit;
    }
}

// =============================================================================
// Потокобезопасность
// =============================================================================

/**
 * @brief Тест: один кодировщик используется из нескольких потоков
 */
TEST_F(AddressEncoderTest, SharedAcrossThreads) {
    std::vector<std::thread> threads;
    std::vector<int> ok(4, 0);

    for (std::size_t t = 0; t < ok.size(); ++t) {
        threads.emplace_back([this, &ok, t] {
            for (int i = 0; i < 100; ++i) {
                auto decoded = mainnet_.decode(MAINNET_P2PK);
                if (decoded && mainnet_.encode(*decoded) == MAINNET_P2PK) {
                    ++ok[t];
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int count : ok) {
        EXPECT_EQ(count, 100);
    }
}

} // namespace ergo::tests
