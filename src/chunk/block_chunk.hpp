#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "chunk/chunk.hpp"

namespace chunk {

// Shared machinery for block-structured chunks. Entries accumulate in an
// uncompressed head block; once the head's encoded size reaches block_size it
// is sealed into an encoded block followed by a CRC32C of the block bytes.
//
// Sealed layout: [block bytes][u32 crc32c_le]
//
// Size accounting is exact: size() equals the bytes the chunk would occupy if
// every block (including the head) were sealed now.
class BlockChunk : public Chunk {
public:
    BlockChunk(std::size_t block_size, std::size_t target_size);

    AppendResult append(std::int64_t ts_ns, std::string_view line) final;
    bool space_for(std::int64_t ts_ns, std::string_view line) const noexcept final;
    std::pair<std::int64_t, std::int64_t> bounds() const noexcept final;
    double utilization() const noexcept final;
    std::size_t size() const noexcept final { return sealed_bytes_ + head_bytes_; }
    std::size_t entry_count() const noexcept final { return entries_; }
    void close() final;
    bool closed() const noexcept final { return closed_; }
    bool for_each(const EntryVisitor& visit) const final;

    std::size_t sealed_block_count() const noexcept { return blocks_.size(); }

    // Flips one byte of a sealed block so tests can exercise checksum failures.
    bool corrupt_block_for_test(std::size_t block, std::size_t offset) noexcept;

protected:
    struct HeadEntry {
        std::int64_t ts_ns;
        std::string line;
    };

    enum class DecodeStatus : std::uint8_t { Ok, Stopped, Corrupt };

    virtual std::size_t block_header_size() const noexcept = 0;
    // prev_ts is the previous entry of the same block, or ts itself for the first.
    virtual std::size_t entry_size(std::int64_t prev_ts, std::int64_t ts, std::size_t line_len) const noexcept = 0;
    virtual void encode_block(const std::vector<HeadEntry>& entries, std::vector<std::byte>& out) const = 0;
    virtual DecodeStatus decode_block(std::span<const std::byte> block, const EntryVisitor& visit) const = 0;

private:
    struct Block {
        std::vector<std::byte> bytes; // encoded block followed by crc
        std::size_t entries{0};
    };

    std::size_t append_cost(std::int64_t ts_ns, std::size_t line_len) const noexcept;
    void seal_head();

    std::size_t block_size_;
    std::size_t target_size_;

    std::vector<Block> blocks_;
    std::vector<HeadEntry> head_;
    std::size_t sealed_bytes_{0};
    std::size_t head_bytes_{0};
    std::size_t entries_{0};
    std::int64_t min_ts_{0};
    std::int64_t max_ts_{0};
    bool closed_{false};
};

// Block payload: [u32 count] then per entry [i64 ts][u32 len][line].
class RawChunk final : public BlockChunk {
public:
    using BlockChunk::BlockChunk;
    Encoding encoding() const noexcept override { return Encoding::Raw; }

protected:
    std::size_t block_header_size() const noexcept override;
    std::size_t entry_size(std::int64_t prev_ts, std::int64_t ts, std::size_t line_len) const noexcept override;
    void encode_block(const std::vector<HeadEntry>& entries, std::vector<std::byte>& out) const override;
    DecodeStatus decode_block(std::span<const std::byte> block, const EntryVisitor& visit) const override;
};

// Block payload: [i64 first_ts][u32 count] then per entry
// [zigzag varint ts - prev_ts][uvarint len][line].
class DeltaChunk final : public BlockChunk {
public:
    using BlockChunk::BlockChunk;
    Encoding encoding() const noexcept override { return Encoding::Delta; }

protected:
    std::size_t block_header_size() const noexcept override;
    std::size_t entry_size(std::int64_t prev_ts, std::int64_t ts, std::size_t line_len) const noexcept override;
    void encode_block(const std::vector<HeadEntry>& entries, std::vector<std::byte>& out) const override;
    DecodeStatus decode_block(std::span<const std::byte> block, const EntryVisitor& visit) const override;
};

} // namespace chunk
