#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace util {

namespace detail {

// Reflected Castagnoli polynomial.
constexpr std::uint32_t poly = 0x82F63B78u;

constexpr std::array<std::uint32_t, 256> make_table() noexcept {
    std::array<std::uint32_t, 256> t{};
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1u) ? (poly ^ (c >> 1)) : (c >> 1);
        }
        t[i] = c;
    }
    return t;
}

} // namespace detail

// Table-driven software CRC32C (Castagnoli). Seals chunk blocks and push frames.
class Crc32c {
public:
    static constexpr std::uint32_t initial = 0xFFFFFFFFu;
    static constexpr std::uint32_t xor_out = 0xFFFFFFFFu;

    static std::uint32_t update(std::uint32_t crc, const std::byte* data, std::size_t len) noexcept {
        for (std::size_t i = 0; i < len; ++i) {
            const auto idx = static_cast<std::uint8_t>((crc ^ static_cast<std::uint8_t>(data[i])) & 0xFFu);
            crc = (crc >> 8) ^ table_[idx];
        }
        return crc;
    }

    static constexpr std::uint32_t finalize(std::uint32_t crc) noexcept { return crc ^ xor_out; }

    static std::uint32_t compute(const std::byte* data, std::size_t len) noexcept {
        return finalize(update(initial, data, len));
    }

    static std::uint32_t compute(std::span<const std::byte> bytes) noexcept {
        return compute(bytes.data(), bytes.size());
    }

private:
    static constexpr std::array<std::uint32_t, 256> table_ = detail::make_table();
};

} // namespace util
