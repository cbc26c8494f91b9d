// TypeProof - Serialization Header
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// Little-endian serialization primitives. Every wire and storage format in
// TypeProof (journal, event stream, ledger values) is written through these.

#ifndef TYPEPROOF_CORE_SERIALIZE_H
#define TYPEPROOF_CORE_SERIALIZE_H

#include "typeproof/core/types.h"
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <string>
#include <ios>
#include <limits>

namespace typeproof {

/// Maximum length accepted for a length-prefixed field
static constexpr uint64_t MAX_SERIALIZED_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// Endianness Helpers
// ============================================================================

namespace detail {

inline uint16_t (htole16)(uint16_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap16(host);
#else
    return host;
#endif
}

inline uint32_t (htole32)(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t (htole64)(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

inline uint16_t (le16toh)(uint16_t little) { return (htole16)(little); }
inline uint32_t (le32toh)(uint32_t little) { return (htole32)(little); }
inline uint64_t (le64toh)(uint64_t little) { return (htole64)(little); }

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer
// ============================================================================

/// Append-only writer and forward-only reader over a byte vector.
/// Reads past the end throw std::ios_base::failure.
class DataStream {
public:
    DataStream() = default;
    explicit DataStream(const Bytes& data) : data_(data) {}
    explicit DataStream(Bytes&& data) : data_(std::move(data)) {}
    DataStream(const Byte* data, size_t len) : data_(data, data + len) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - readPos_; }
    bool empty() const noexcept { return size() == 0; }

    /// Total bytes written
    size_t TotalSize() const noexcept { return data_.size(); }

    /// Full underlying buffer (including consumed bytes)
    const Bytes& Data() const noexcept { return data_; }

    /// Release the underlying buffer
    Bytes Release() {
        readPos_ = 0;
        return std::move(data_);
    }

    void reserve(size_t n) { data_.reserve(n); }

    void Write(const Byte* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Read(Byte* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + readPos_, len);
        readPos_ += len;
    }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    Bytes data_;
    size_t readPos_{0};
};

// ============================================================================
// Fixed-width Integers
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t v) {
    s.Write(&v, 1);
}

template<typename Stream>
inline void ser_writedata16(Stream& s, uint16_t v) {
    v = (detail::htole16)(v);
    s.Write(reinterpret_cast<const Byte*>(&v), 2);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t v) {
    v = (detail::htole32)(v);
    s.Write(reinterpret_cast<const Byte*>(&v), 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t v) {
    v = (detail::htole64)(v);
    s.Write(reinterpret_cast<const Byte*>(&v), 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t v;
    s.Read(&v, 1);
    return v;
}

template<typename Stream>
inline uint16_t ser_readdata16(Stream& s) {
    uint16_t v;
    s.Read(reinterpret_cast<Byte*>(&v), 2);
    return (detail::le16toh)(v);
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint32_t v;
    s.Read(reinterpret_cast<Byte*>(&v), 4);
    return (detail::le32toh)(v);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint64_t v;
    s.Read(reinterpret_cast<Byte*>(&v), 8);
    return (detail::le64toh)(v);
}

// ============================================================================
// CompactSize
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 0xFD + 2 bytes
//   size <= 0xFFFFFFFF -- 0xFE + 4 bytes
//   otherwise          -- 0xFF + 8 bytes

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writedata8(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        ser_writedata8(s, 0xFD);
        ser_writedata16(s, static_cast<uint16_t>(size));
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
// Serialize / Unserialize
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint16_t a) { ser_writedata16(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint16_t& a) { a = ser_readdata16(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writedata8(s, a ? 1 : 0); }
template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = (ser_readdata8(s) != 0); }

// Fixed blobs are written raw, without a length prefix
template<typename Stream, size_t N>
void Serialize(Stream& s, const FixedBlob<N>& blob) {
    s.Write(blob.data(), N);
}

template<typename Stream, size_t N>
void Unserialize(Stream& s, FixedBlob<N>& blob) {
    s.Read(blob.data(), N);
}

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(reinterpret_cast<const Byte*>(str.data()), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(static_cast<size_t>(size));
    if (size > 0) {
        s.Read(reinterpret_cast<Byte*>(&str[0]), static_cast<size_t>(size));
    }
}

template<typename Stream>
void Serialize(Stream& s, const Bytes& v) {
    WriteCompactSize(s, v.size());
    if (!v.empty()) {
        s.Write(v.data(), v.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, Bytes& v) {
    uint64_t size = ReadCompactSize(s);
    v.resize(static_cast<size_t>(size));
    if (size > 0) {
        s.Read(v.data(), static_cast<size_t>(size));
    }
}

// Types exposing SerializeTo/UnserializeFrom members
template<typename Stream, typename T>
auto Serialize(Stream& s, const T& obj) -> decltype(obj.SerializeTo(s), void()) {
    obj.SerializeTo(s);
}

template<typename Stream, typename T>
auto Unserialize(Stream& s, T& obj) -> decltype(obj.UnserializeFrom(s), void()) {
    obj.UnserializeFrom(s);
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
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

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

} // namespace typeproof

#endif // TYPEPROOF_CORE_SERIALIZE_H
