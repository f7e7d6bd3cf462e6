// VELOCK - Core Types Tests
// Copyright (c) 2024 VELOCK Developers
// MIT License

#include <gtest/gtest.h>
#include "velock/core/hex.h"
#include "velock/core/result.h"
#include "velock/core/types.h"

#include <limits>
#include <map>
#include <stdexcept>

using namespace velock;

// ============================================================================
// Hex Tests
// ============================================================================

TEST(HexTest, BytesToHex) {
    std::vector<uint8_t> bytes = {0x00, 0x01, 0xab, 0xff};
    EXPECT_EQ(BytesToHex(bytes), "0001abff");
    EXPECT_EQ(BytesToHex(std::vector<uint8_t>{}), "");
}

TEST(HexTest, HexToBytesAcceptsBothCases) {
    auto bytes = HexToBytes("00aBFf");
    ASSERT_EQ(bytes.size(), 3u);
    EXPECT_EQ(bytes[1], 0xab);
    EXPECT_EQ(bytes[2], 0xff);
}

TEST(HexTest, HexToBytesRejectsMalformed) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("deadBEEF"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("abc"));
    EXPECT_FALSE(IsValidHex("0xab"));
}

TEST(HexTest, StripHexPrefix) {
    EXPECT_EQ(StripHexPrefix("0xab"), "ab");
    EXPECT_EQ(StripHexPrefix("0Xab"), "ab");
    EXPECT_EQ(StripHexPrefix("ab"), "ab");
    EXPECT_EQ(StripHexPrefix("0"), "0");
}

// ============================================================================
// AccountId Tests
// ============================================================================

TEST(AccountIdTest, DefaultIsNull) {
    AccountId id;
    EXPECT_TRUE(id.IsNull());
    EXPECT_EQ(id.size(), 20u);
    EXPECT_EQ(id.ToHex(), std::string(40, '0'));
}

TEST(AccountIdTest, ShortBufferIsZeroPadded) {
    const Byte name[] = {'b', 'o', 'b'};
    AccountId id(name, sizeof(name));
    EXPECT_EQ(id[0], 'b');
    EXPECT_EQ(id[2], 'b');
    EXPECT_EQ(id[3], 0);
    EXPECT_EQ(id[19], 0);
    EXPECT_FALSE(id.IsNull());
}

TEST(AccountIdTest, FromHexRoundTrip) {
    const std::string hex = "00112233445566778899aabbccddeeff01234567";
    auto id = AccountId::FromHex("0x" + hex);
    ASSERT_TRUE(id);
    EXPECT_EQ(id->ToHex(), hex);
    EXPECT_EQ((*id)[0], 0x00);
    EXPECT_EQ((*id)[19], 0x67);
    EXPECT_EQ(id->ToShortString(), "0x0011..4567");
}

TEST(AccountIdTest, FromHexRejectsWrongLength) {
    EXPECT_FALSE(AccountId::FromHex("0x0011"));
    EXPECT_FALSE(AccountId::FromHex(std::string(42, 'a')));
    EXPECT_FALSE(AccountId::FromHex(std::string(40, 'g')));
}

TEST(AccountIdTest, FromNameAcceptsHexAndShortNames) {
    auto hex = AccountId::FromName("0x00112233445566778899aabbccddeeff01234567");
    ASSERT_TRUE(hex);
    EXPECT_EQ((*hex)[19], 0x67);

    auto alice = AccountId::FromName("alice");
    ASSERT_TRUE(alice);
    EXPECT_EQ((*alice)[0], 'a');
    EXPECT_EQ((*alice)[5], 0);

    auto full = AccountId::FromName("abcdefghijklmnopqrst");
    ASSERT_TRUE(full);
    EXPECT_EQ((*full)[19], 't');
}

TEST(AccountIdTest, FromNameRejectsLongNames) {
    // Truncating would make these two names one account
    EXPECT_FALSE(AccountId::FromName("abcdefghijklmnopqrstu"));
    EXPECT_FALSE(AccountId::FromName("abcdefghijklmnopqrstv"));
    EXPECT_FALSE(AccountId::FromName(""));
}

TEST(AccountIdTest, OrderingIsBytewise) {
    std::array<Byte, 20> low{};
    std::array<Byte, 20> high{};
    low[19] = 0xff;
    high[0] = 0x01;

    AccountId a(low);
    AccountId b(high);
    EXPECT_LT(a, b);
    EXPECT_NE(a, b);

    std::map<AccountId, int> accounts{{b, 2}, {a, 1}};
    EXPECT_EQ(accounts.begin()->second, 1);
}

// ============================================================================
// OpResult Tests
// ============================================================================

TEST(OpResultTest, SuccessAndError) {
    EXPECT_TRUE(OpResult::Success().IsOk());
    EXPECT_EQ(OpResult::Success().ToString(), "OK");

    OpResult error = OpResult::Error(ErrorCode::InvalidDuration, "0 epochs");
    EXPECT_FALSE(error.IsOk());
    EXPECT_EQ(error.ToString(), "InvalidDuration: 0 epochs");
    EXPECT_EQ(OpResult::Error(ErrorCode::Reentrancy).ToString(), "Reentrancy");
}

TEST(OpResultTest, EveryCodeHasName) {
    for (int c = static_cast<int>(ErrorCode::OK); c <= static_cast<int>(ErrorCode::Reentrancy); ++c) {
        EXPECT_STRNE(ErrorCodeToString(static_cast<ErrorCode>(c)), "Unknown") << c;
    }
}

// ============================================================================
// Checked Arithmetic Tests
// ============================================================================

TEST(CheckedArithmeticTest, UnsignedBounds) {
    Amount out = 7;
    EXPECT_TRUE(CheckedAdd<Amount>(MAX_AMOUNT - 1, 1, out));
    EXPECT_EQ(out, MAX_AMOUNT);
    EXPECT_FALSE(CheckedAdd<Amount>(MAX_AMOUNT, 1, out));
    EXPECT_EQ(out, MAX_AMOUNT);

    EXPECT_FALSE(CheckedSub<Amount>(3, 4, out));
    EXPECT_TRUE(CheckedSub<Amount>(4, 4, out));
    EXPECT_EQ(out, 0u);

    EXPECT_TRUE(CheckedMul<Amount>(0, MAX_AMOUNT, out));
    EXPECT_EQ(out, 0u);
    EXPECT_TRUE(CheckedMul<Amount>(1ULL << 32, (1ULL << 32) - 1, out));
    EXPECT_FALSE(CheckedMul<Amount>(1ULL << 32, 1ULL << 32, out));
}

TEST(CheckedArithmeticTest, SignedBounds) {
    SignedAmount out = 0;
    EXPECT_TRUE(CheckedAdd<SignedAmount>(MIN_SIGNED_AMOUNT, MAX_SIGNED_AMOUNT, out));
    EXPECT_EQ(out, -1);
    EXPECT_FALSE(CheckedAdd<SignedAmount>(MAX_SIGNED_AMOUNT, 1, out));
    EXPECT_FALSE(CheckedAdd<SignedAmount>(MIN_SIGNED_AMOUNT, -1, out));

    EXPECT_FALSE(CheckedSub<SignedAmount>(MIN_SIGNED_AMOUNT, 1, out));
    EXPECT_FALSE(CheckedSub<SignedAmount>(0, MIN_SIGNED_AMOUNT, out));
    EXPECT_TRUE(CheckedSub<SignedAmount>(-1, MIN_SIGNED_AMOUNT, out));
    EXPECT_EQ(out, MAX_SIGNED_AMOUNT);
    EXPECT_EQ(MAX_SIGNED_AMOUNT, std::numeric_limits<int64_t>::max());
}
