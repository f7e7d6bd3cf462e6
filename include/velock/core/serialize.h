// VELOCK - Serialization Header
// Copyright (c) 2024 VELOCK Developers
// MIT License
//
// Little-endian binary serialization used for ledger snapshots.
// Based on Bitcoin's serialization with simplifications for clarity.

#ifndef VELOCK_CORE_SERIALIZE_H
#define VELOCK_CORE_SERIALIZE_H

#include "velock/core/types.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace velock {

// ============================================================================
// Constants
// ============================================================================

/// Maximum size for serialized containers to prevent memory exhaustion
static constexpr uint64_t MAX_SERIALIZED_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// Endianness Helpers (Always Little-Endian for serialization)
// ============================================================================

namespace detail {

inline uint16_t htole16(uint16_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap16(host);
#else
    return host;
#endif
}

inline uint32_t htole32(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t htole64(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using size_type = std::size_t;

    DataStream() = default;

    explicit DataStream(const std::vector<uint8_t>& data) : data_(data) {}

    explicit DataStream(std::vector<uint8_t>&& data) : data_(std::move(data)) {}

    DataStream(const uint8_t* data, size_type len) : data_(data, data + len) {}

    /// Returns unread bytes remaining
    size_type size() const noexcept { return data_.size() - readPos_; }

    bool empty() const noexcept { return size() == 0; }

    /// Pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + readPos_; }

    /// Whole buffer, including bytes already read
    const std::vector<uint8_t>& Data() const noexcept { return data_; }

    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_type len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        if (len > 0) {
            std::memcpy(dst, data_.data() + readPos_, len);
        }
        readPos_ += len;
    }

    void Read(char* dst, size_type len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> data_;
    size_type readPos_{0};
};

// ============================================================================
// Low-Level Serialization Functions
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    obj = detail::htole32(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    obj = detail::htole64(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint16_t ser_readdata16(Stream& s) {
    uint16_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 2);
    return detail::htole16(obj);
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint32_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 4);
    return detail::htole32(obj);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint64_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 8);
    return detail::htole64(obj);
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 3 bytes (0xFD + 2 bytes little-endian)
//   size <= 0xFFFFFFFF -- 5 bytes (0xFE + 4 bytes little-endian)
//   size >  0xFFFFFFFF -- 9 bytes (0xFF + 8 bytes little-endian)

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writedata8(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        ser_writedata8(s, 0xFD);
        uint16_t v = detail::htole16(static_cast<uint16_t>(size));
        s.Write(reinterpret_cast<const uint8_t*>(&v), 2);
    } else if (size <= 0xFFFFFFFF) {
        ser_writedata8(s, 0xFE);
        ser_writedata32(s, static_cast<uint32_t>(size));
    } else {
        ser_writedata8(s, 0xFF);
        ser_writedata64(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ser_readdata8(s);
    uint64_t size = 0;

    if (marker < 253) {
        size = marker;
    } else if (marker == 253) {
        size = ser_readdata16(s);
        if (size < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (marker == 254) {
        size = ser_readdata32(s);
        if (size < 0x10000) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else {
        size = ser_readdata64(s);
        if (size < 0x100000000ULL) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    }

    if (size > MAX_SERIALIZED_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }

    return size;
}

// ============================================================================
// Container declarations (so nested containers resolve at instantiation)
// ============================================================================

template<typename Stream, typename A, typename B>
void Serialize(Stream& s, const std::pair<A, B>& p);
template<typename Stream, typename A, typename B>
void Unserialize(Stream& s, std::pair<A, B>& p);
template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v);
template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v);
template<typename Stream, typename K, typename V>
void Serialize(Stream& s, const std::map<K, V>& m);
template<typename Stream, typename K, typename V>
void Unserialize(Stream& s, std::map<K, V>& m);

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { ser_writedata64(s, static_cast<uint64_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ser_readdata64(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writedata8(s, a ? 1 : 0); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = (ser_readdata8(s) != 0); }

// ============================================================================
// Strings and Identifiers
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

template<typename Stream>
void Serialize(Stream& s, const AccountId& id) {
    s.Write(id.data(), AccountId::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, AccountId& id) {
    s.Read(id.data(), AccountId::SIZE);
}

// ============================================================================
// Containers
// ============================================================================

template<typename Stream, typename A, typename B>
void Serialize(Stream& s, const std::pair<A, B>& p) {
    Serialize(s, p.first);
    Serialize(s, p.second);
}

template<typename Stream, typename A, typename B>
void Unserialize(Stream& s, std::pair<A, B>& p) {
    Unserialize(s, p.first);
    Unserialize(s, p.second);
}

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v) {
    WriteCompactSize(s, v.size());
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v) {
    uint64_t size = ReadCompactSize(s);
    v.clear();
    v.reserve(std::min<uint64_t>(size, 4096));
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

template<typename Stream, typename K, typename V>
void Serialize(Stream& s, const std::map<K, V>& m) {
    WriteCompactSize(s, m.size());
    for (const auto& [key, value] : m) {
        Serialize(s, key);
        Serialize(s, value);
    }
}

template<typename Stream, typename K, typename V>
void Unserialize(Stream& s, std::map<K, V>& m) {
    uint64_t size = ReadCompactSize(s);
    m.clear();
    for (uint64_t i = 0; i < size; ++i) {
        K key;
        V value;
        Unserialize(s, key);
        Unserialize(s, value);
        if (!m.emplace(std::move(key), std::move(value)).second) {
            throw std::ios_base::failure("Unserialize(map): duplicate key");
        }
    }
}

// ============================================================================
// DataStream Stream Operators Implementation
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace velock

#endif // VELOCK_CORE_SERIALIZE_H
