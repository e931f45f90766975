/**
 * @file test_base58.cpp
 * @brief Тесты Base58 и hex кодирования
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "encoding/base58.hpp"
#include "encoding/hex.hpp"

namespace ergo::tests {

using encoding::base58_decode;
using encoding::base58_encode;

// =============================================================================
// Base58 Encode
// =============================================================================

TEST(Base58Test, EncodeEmpty) {
    EXPECT_EQ(base58_encode(Bytes{}), "");
}

TEST(Base58Test, EncodeSingleZero) {
    EXPECT_EQ(base58_encode(Bytes{0}), "1");
}

TEST(Base58Test, EncodeLeadingZeros) {
    EXPECT_EQ(base58_encode(Bytes{0, 0, 0, 1}), "1112");
}

TEST(Base58Test, EncodeHelloWorld) {
    const std::string input = "Hello World";
    const Bytes data(input.begin(), input.end());
    EXPECT_EQ(base58_encode(data), "JxF12TrwUP45BMd");
}

TEST(Base58Test, EncodeByte57) {
    // 57 - последний символ алфавита
    EXPECT_EQ(base58_encode(Bytes{57}), "z");
}

// =============================================================================
// Base58 Decode
// =============================================================================

TEST(Base58Test, DecodeHelloWorld) {
    auto result = base58_decode("JxF12TrwUP45BMd");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::string(result->begin(), result->end()), "Hello World");
}

TEST(Base58Test, DecodeLeadingOnes) {
    auto result = base58_decode("1112");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, (Bytes{0, 0, 0, 1}));
}

TEST(Base58Test, DecodeEmptyFails) {
    auto result = base58_decode("");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::AddressMalformedEncoding);
}

/**
 * @brief Тест: символы вне алфавита (0, O, I, l и не-ASCII)
 */
TEST(Base58Test, DecodeInvalidCharacters) {
    for (const char* input : {"0", "O", "I", "l", "abc+", "9fR AWh", "\xd0\x96"}) {
        auto result = base58_decode(input);
        ASSERT_FALSE(result.has_value()) << input;
        EXPECT_EQ(result.error().code, ErrorCode::AddressMalformedEncoding) << input;
    }
}

TEST(Base58Test, RoundTripWithLeadingZeros) {
    const Bytes original = {0, 0, 0xDE, 0xAD, 0xBE, 0xEF};
    auto decoded = base58_decode(base58_encode(original));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, original);
}

TEST(Base58Test, IsBase58) {
    EXPECT_TRUE(encoding::is_base58("9fRAWhdxEsTcdb8PhGNrZfwqa65zfkuYHAMmkQLcic1gdLSV5vA"));
    EXPECT_FALSE(encoding::is_base58(""));
    EXPECT_FALSE(encoding::is_base58("0xdead"));
}

// =============================================================================
// Hex
// =============================================================================

TEST(HexTest, ToHex) {
    EXPECT_EQ(encoding::to_hex(Bytes{0x00, 0x0f, 0xab, 0xff}), "000fabff");
    EXPECT_EQ(encoding::to_hex(Bytes{}), "");
}

TEST(HexTest, FromHex) {
    auto result = encoding::from_hex("0x000FabFF");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, (Bytes{0x00, 0x0f, 0xab, 0xff}));
}

TEST(HexTest, FromHexInvalid) {
    auto odd = encoding::from_hex("abc");
    ASSERT_FALSE(odd.has_value());
    EXPECT_EQ(odd.error().code, ErrorCode::EncodingInvalidHex);

    auto bad = encoding::from_hex("zz");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::EncodingInvalidHex);
}

} // namespace ergo::tests
