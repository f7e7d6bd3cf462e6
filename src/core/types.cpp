// VELOCK - Core Types Implementation
// Copyright (c) 2024 VELOCK Developers
// MIT License

#include "velock/core/types.h"
#include "velock/core/hex.h"

namespace velock {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

// Explicit template instantiations
template class BaseHash<160>;

// ============================================================================
// AccountId Implementation
// ============================================================================

std::optional<AccountId> AccountId::FromHex(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.size() != SIZE * 2 || !IsValidHex(digits)) {
        return std::nullopt;
    }
    auto bytes = HexToBytes(digits);
    return AccountId(bytes.data(), bytes.size());
}

std::optional<AccountId> AccountId::FromName(const std::string& name) {
    if (auto id = FromHex(name)) {
        return id;
    }
    if (name.empty() || name.size() > SIZE) {
        return std::nullopt;
    }
    return AccountId(reinterpret_cast<const Byte*>(name.data()), name.size());
}

std::string AccountId::ToShortString() const {
    std::string hex = ToHex();
    return "0x" + hex.substr(0, 4) + ".." + hex.substr(hex.size() - 4);
}

} // namespace velock
