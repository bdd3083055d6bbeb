// VALORIA - Serialization Header
// Copyright (c) 2024 VALORIA Developers
// MIT License
//
// Binary encoding of every record VALORIA persists. Integers are fixed-width
// little-endian regardless of host byte order; strings carry a CompactSize
// length prefix.

#ifndef VALORIA_CORE_SERIALIZE_H
#define VALORIA_CORE_SERIALIZE_H

#include "valoria/core/types.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <type_traits>
#include <vector>

namespace valoria {

/// Largest length prefix accepted when decoding
static constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB

/// Integer types with a fixed-width encoding
template<typename T>
using EnableIfFixedInt =
    std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int>;

// ============================================================================
// DataStream
// ============================================================================

/**
 * Growable byte buffer with a read cursor. Writes append; reads consume from
 * the front and throw std::ios_base::failure past the end, which is how a
 * truncated record surfaces to DeserializeFromString().
 */
class DataStream {
public:
    DataStream() = default;
    DataStream(const uint8_t* data, size_t len) : buf_(data, data + len) {}
    explicit DataStream(const std::string& bytes)
        : buf_(bytes.begin(), bytes.end()) {}

    size_t size() const noexcept { return buf_.size() - cursor_; }
    bool empty() const noexcept { return cursor_ == buf_.size(); }
    const uint8_t* data() const noexcept { return buf_.data() + cursor_; }

    /// Unread bytes as a string, the form the key-value store takes
    std::string str() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }

    void Write(const void* src, size_t len) {
        const auto* p = static_cast<const uint8_t*>(src);
        buf_.insert(buf_.end(), p, p + len);
    }

    void Read(void* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream: read past end of record");
        }
        std::memcpy(dst, data(), len);
        cursor_ += len;
    }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> buf_;
    size_t cursor_{0};
};

// ============================================================================
// Fixed-Width Integers
// ============================================================================

template<typename Stream, typename T, EnableIfFixedInt<T> = 0>
void WriteLE(Stream& s, T value) {
    using U = std::make_unsigned_t<T>;
    const U bits = static_cast<U>(value);
    uint8_t out[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
        out[i] = static_cast<uint8_t>(bits >> (8 * i));
    }
    s.Write(out, sizeof(T));
}

template<typename T, typename Stream, EnableIfFixedInt<T> = 0>
T ReadLE(Stream& s) {
    using U = std::make_unsigned_t<T>;
    uint8_t in[sizeof(T)];
    s.Read(in, sizeof(T));
    U bits = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        bits = static_cast<U>(bits | (static_cast<U>(in[i]) << (8 * i)));
    }
    return static_cast<T>(bits);
}

// ============================================================================
// CompactSize
// ============================================================================
//   < 0xFD        value itself, 1 byte
//   <= 0xFFFF     0xFD + uint16
//   <= 0xFFFFFFFF 0xFE + uint32
//   otherwise     0xFF + uint64
// Decoding rejects a wider form than the value needs.

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 0xFD) {
        WriteLE(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        WriteLE(s, uint8_t{0xFD});
        WriteLE(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        WriteLE(s, uint8_t{0xFE});
        WriteLE(s, static_cast<uint32_t>(size));
    } else {
        WriteLE(s, uint8_t{0xFF});
        WriteLE(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    const uint8_t marker = ReadLE<uint8_t>(s);
    uint64_t size = marker;
    uint64_t smallest = 0;

    switch (marker) {
        case 0xFD: size = ReadLE<uint16_t>(s); smallest = 0xFD; break;
        case 0xFE: size = ReadLE<uint32_t>(s); smallest = 0x10000; break;
        case 0xFF: size = ReadLE<uint64_t>(s); smallest = 0x100000000ULL; break;
        default: break;
    }

    if (size < smallest) {
        throw std::ios_base::failure("non-canonical CompactSize");
    }
    if (size > MAX_SIZE) {
        throw std::ios_base::failure("CompactSize exceeds MAX_SIZE");
    }
    return size;
}

// ============================================================================
// Serialize / Unserialize
// ============================================================================

template<typename Stream, typename T, EnableIfFixedInt<T> = 0>
void Serialize(Stream& s, T value) {
    WriteLE(s, value);
}

template<typename Stream, typename T, EnableIfFixedInt<T> = 0>
void Unserialize(Stream& s, T& value) {
    value = ReadLE<T>(s);
}

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    s.Write(str.data(), str.size());
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    const uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
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

} // namespace valoria

#endif // VALORIA_CORE_SERIALIZE_H
