// VELOCK - Core Types Header
// Copyright (c) 2024 VELOCK Developers
// MIT License
//
// This file defines fundamental types used throughout VELOCK.

#ifndef VELOCK_CORE_TYPES_H
#define VELOCK_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

namespace velock {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Asset amount in smallest units (never negative)
using Amount = uint64_t;

/// Signed amount, used for slopes and slope deltas
using SignedAmount = int64_t;

/// Epoch number (1-indexed, 0 means "before the origin")
using Epoch = uint64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Governance proposal identifier (monotonic, starts at 1)
using ProposalId = uint64_t;

/// Largest representable amount
constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

/// Bounds of a slope
constexpr SignedAmount MAX_SIGNED_AMOUNT = std::numeric_limits<SignedAmount>::max();
constexpr SignedAmount MIN_SIGNED_AMOUNT = std::numeric_limits<SignedAmount>::min();

// ============================================================================
// Checked Arithmetic
// ============================================================================

/// out = a + b. Returns false and leaves out untouched on overflow.
template<typename T>
bool CheckedAdd(T a, T b, T& out) {
    static_assert(std::is_integral<T>::value, "CheckedAdd needs integral operands");
    if constexpr (std::is_signed<T>::value) {
        if (b < 0 ? a < std::numeric_limits<T>::min() - b
                  : a > std::numeric_limits<T>::max() - b) {
            return false;
        }
    } else {
        if (a > std::numeric_limits<T>::max() - b) {
            return false;
        }
    }
    out = a + b;
    return true;
}

/// out = a - b. Returns false and leaves out untouched on overflow.
template<typename T>
bool CheckedSub(T a, T b, T& out) {
    static_assert(std::is_integral<T>::value, "CheckedSub needs integral operands");
    if constexpr (std::is_signed<T>::value) {
        if (b < 0 ? a > std::numeric_limits<T>::max() + b
                  : a < std::numeric_limits<T>::min() + b) {
            return false;
        }
    } else {
        if (a < b) {
            return false;
        }
    }
    out = a - b;
    return true;
}

/// out = a * b for unsigned operands. Returns false on overflow.
template<typename T>
bool CheckedMul(T a, T b, T& out) {
    static_assert(std::is_unsigned<T>::value, "CheckedMul needs unsigned operands");
    if (a != 0 && b > std::numeric_limits<T>::max() / a) {
        return false;
    }
    out = a * b;
    return true;
}

// ============================================================================
// Fixed-size Identifier Template
// ============================================================================

/// Fixed-width opaque identifier
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null identifier
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero padded)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if all bytes are zero
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to lowercase hex string (natural byte order)
    std::string ToHex() const;

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Account Identifier
// ============================================================================

/// 160-bit account address
class AccountId : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    AccountId() = default;

    /// Parse a 40-character hex string, optionally prefixed with "0x"
    static std::optional<AccountId> FromHex(const std::string& hex);

    /// Hex id as FromHex, otherwise a name of 1 to SIZE bytes stored
    /// zero-padded. Longer names are rejected rather than truncated.
    static std::optional<AccountId> FromName(const std::string& name);

    /// Short form for log output ("0x1234..abcd")
    std::string ToShortString() const;
};

} // namespace velock

#endif // VELOCK_CORE_TYPES_H
