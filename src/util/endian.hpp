#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>
#include <vector>

namespace util {

inline constexpr std::uint16_t byteswap16(std::uint16_t v) noexcept {
    return static_cast<std::uint16_t>((v >> 8) | (v << 8));
}

inline constexpr std::uint32_t byteswap32(std::uint32_t v) noexcept {
    return ((v & 0xFF000000u) >> 24) | ((v & 0x00FF0000u) >> 8) |
           ((v & 0x0000FF00u) << 8) | ((v & 0x000000FFu) << 24);
}

inline constexpr std::uint64_t byteswap64(std::uint64_t v) noexcept {
    return (static_cast<std::uint64_t>(byteswap32(static_cast<std::uint32_t>(v))) << 32) |
           byteswap32(static_cast<std::uint32_t>(v >> 32));
}

template <typename T>
inline constexpr T to_le(T v) noexcept {
    if constexpr (std::endian::native == std::endian::little || sizeof(T) == 1) {
        return v;
    } else if constexpr (sizeof(T) == 2) {
        return byteswap16(v);
    } else if constexpr (sizeof(T) == 4) {
        return byteswap32(v);
    } else {
        return byteswap64(v);
    }
}

template <typename T>
inline T load_le(const std::byte* p) noexcept {
    T v{};
    std::memcpy(&v, p, sizeof(v));
    return to_le(v);
}

template <typename T>
inline void store_le(T v, std::byte* p) noexcept {
    const T le = to_le(v);
    std::memcpy(p, &le, sizeof(le));
}

// Append helpers for growable encode buffers.
template <typename T>
inline void append_le(std::vector<std::byte>& buf, T v) {
    const std::size_t at = buf.size();
    buf.resize(at + sizeof(T));
    store_le(v, buf.data() + at);
}

inline void append_bytes(std::vector<std::byte>& buf, std::string_view s) {
    const std::size_t at = buf.size();
    buf.resize(at + s.size());
    if (!s.empty()) {
        std::memcpy(buf.data() + at, s.data(), s.size());
    }
}

inline std::size_t uvarint_size(std::uint64_t v) noexcept {
    std::size_t n = 1;
    while (v >= 0x80) {
        v >>= 7;
        ++n;
    }
    return n;
}

inline void append_uvarint(std::vector<std::byte>& buf, std::uint64_t v) {
    while (v >= 0x80) {
        buf.push_back(static_cast<std::byte>((v & 0x7F) | 0x80));
        v >>= 7;
    }
    buf.push_back(static_cast<std::byte>(v));
}

// Advances p past the varint. Fails on truncation or more than 10 bytes.
inline bool read_uvarint(const std::byte*& p, const std::byte* end, std::uint64_t& out) noexcept {
    std::uint64_t v = 0;
    for (unsigned shift = 0; shift < 70 && p < end; shift += 7) {
        const auto b = static_cast<std::uint8_t>(*p++);
        v |= static_cast<std::uint64_t>(b & 0x7F) << shift;
        if ((b & 0x80) == 0) {
            out = v;
            return true;
        }
    }
    return false;
}

inline constexpr std::uint64_t zigzag_encode(std::int64_t v) noexcept {
    return (static_cast<std::uint64_t>(v) << 1) ^ static_cast<std::uint64_t>(v >> 63);
}

inline constexpr std::int64_t zigzag_decode(std::uint64_t v) noexcept {
    return static_cast<std::int64_t>(v >> 1) ^ -static_cast<std::int64_t>(v & 1);
}

} // namespace util
