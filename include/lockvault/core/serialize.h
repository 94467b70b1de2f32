// LOCKVAULT - Serialization Header
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License
//
// Byte encoding for persisted vault and ledger records. Integers are
// little-endian and fixed width; strings carry a CompactSize length.
// Records add their own version byte on top of this (see vault/position.h).

#ifndef LOCKVAULT_CORE_SERIALIZE_H
#define LOCKVAULT_CORE_SERIALIZE_H

#include "lockvault/core/types.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <type_traits>
#include <vector>

namespace lockvault {

/// Largest length prefix accepted when reading
static constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    DataStream() = default;
    explicit DataStream(const std::vector<uint8_t>& data) : data_(data) {}
    DataStream(const uint8_t* data, size_t len) : data_(data, data + len) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - readPos_; }
    bool empty() const noexcept { return size() == 0; }

    const uint8_t* data() const noexcept { return data_.data() + readPos_; }

    void Write(const uint8_t* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }
    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    /// Throws std::ios_base::failure past the end of the buffer
    void Read(uint8_t* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + readPos_, len);
        readPos_ += len;
    }
    void Read(char* dst, size_t len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    /// Hex dump of the unread bytes
    std::string ToHex() const;

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> data_;
    size_t readPos_{0};
};

// ============================================================================
// Fixed-Width Integers
// ============================================================================

/// Write the low sizeof(T) bytes of value, least significant first
template<typename Stream, typename T>
void WriteLE(Stream& s, T value) {
    static_assert(std::is_unsigned<T>::value, "WriteLE takes unsigned types");
    uint8_t buf[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    s.Write(buf, sizeof(T));
}

template<typename T, typename Stream>
T ReadLE(Stream& s) {
    static_assert(std::is_unsigned<T>::value, "ReadLE takes unsigned types");
    uint8_t buf[sizeof(T)];
    s.Read(buf, sizeof(T));
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(buf[i]) << (8 * i);
    }
    return value;
}

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { WriteLE(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ReadLE<uint8_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { WriteLE(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ReadLE<uint32_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, int32_t a) { WriteLE(s, static_cast<uint32_t>(a)); }
template<typename Stream>
inline void Unserialize(Stream& s, int32_t& a) { a = static_cast<int32_t>(ReadLE<uint32_t>(s)); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { WriteLE(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ReadLE<uint64_t>(s); }

// Amounts and timestamps
template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { WriteLE(s, static_cast<uint64_t>(a)); }
template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ReadLE<uint64_t>(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { WriteLE(s, static_cast<uint8_t>(a ? 1 : 0)); }
template<typename Stream>
inline void Unserialize(Stream& s, bool& a) {
    uint8_t v = ReadLE<uint8_t>(s);
    if (v > 1) {
        throw std::ios_base::failure("Unserialize(): invalid boolean");
    }
    a = v != 0;
}

// ============================================================================
// CompactSize Length Prefix
// ============================================================================

// < 253: one byte; then 0xFD/0xFE/0xFF markers followed by 2/4/8 bytes.
// Readers reject a longer form than the value needs.

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        WriteLE(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        WriteLE(s, static_cast<uint8_t>(0xFD));
        WriteLE(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        WriteLE(s, static_cast<uint8_t>(0xFE));
        WriteLE(s, static_cast<uint32_t>(size));
    } else {
        WriteLE(s, static_cast<uint8_t>(0xFF));
        WriteLE(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ReadLE<uint8_t>(s);
    uint64_t size = marker;
    uint64_t smallest = 0;

    if (marker == 0xFD) {
        size = ReadLE<uint16_t>(s);
        smallest = 253;
    } else if (marker == 0xFE) {
        size = ReadLE<uint32_t>(s);
        smallest = 0x10000;
    } else if (marker == 0xFF) {
        size = ReadLE<uint64_t>(s);
        smallest = 0x100000000ULL;
    }

    if (size < smallest) {
        throw std::ios_base::failure("non-canonical ReadCompactSize()");
    }
    if (size > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Strings and Addresses
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
void Serialize(Stream& s, const Address& addr) {
    s.Write(addr.data(), Address::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Address& addr) {
    s.Read(addr.data(), Address::SIZE);
}

// ============================================================================
// Size Without Serializing
// ============================================================================

class SizeComputer {
public:
    void Write(const uint8_t*, size_t len) { size_ += len; }
    void Write(const char*, size_t len) { size_ += len; }
    size_t size() const noexcept { return size_; }

private:
    size_t size_{0};
};

template<typename T>
size_t GetSerializeSize(const T& obj) {
    SizeComputer sc;
    Serialize(sc, obj);
    return sc.size();
}

// ============================================================================
// DataStream Operators
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

} // namespace lockvault

#endif // LOCKVAULT_CORE_SERIALIZE_H
