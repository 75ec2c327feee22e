#include "chunk/block_chunk.hpp"

#include <algorithm>
#include <stdexcept>

#include "util/crc32c.hpp"
#include "util/endian.hpp"

namespace chunk {
namespace {

constexpr std::size_t crc_size = sizeof(std::uint32_t);

inline std::int64_t wrapping_sub(std::int64_t a, std::int64_t b) noexcept {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) - static_cast<std::uint64_t>(b));
}

inline std::int64_t wrapping_add(std::int64_t a, std::int64_t b) noexcept {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) + static_cast<std::uint64_t>(b));
}

inline std::string_view as_line(const std::byte* p, std::size_t len) noexcept {
    return std::string_view(reinterpret_cast<const char*>(p), len);
}

} // namespace

BlockChunk::BlockChunk(std::size_t block_size, std::size_t target_size)
    : block_size_(block_size)
    , target_size_(target_size) {
    if (block_size_ == 0 || target_size_ == 0) {
        throw std::invalid_argument("chunk block_size and target_size must be > 0");
    }
    if (block_size_ > target_size_) {
        throw std::invalid_argument("chunk block_size must not exceed target_size");
    }
}

std::size_t BlockChunk::append_cost(std::int64_t ts_ns, std::size_t line_len) const noexcept {
    if (head_.empty()) {
        return block_header_size() + crc_size + entry_size(ts_ns, ts_ns, line_len);
    }
    return entry_size(head_.back().ts_ns, ts_ns, line_len);
}

AppendResult BlockChunk::append(std::int64_t ts_ns, std::string_view line) {
    if (closed_) {
        return AppendResult::Closed;
    }
    const std::size_t alone = block_header_size() + crc_size + entry_size(ts_ns, ts_ns, line.size());
    if (alone > target_size_) {
        return AppendResult::TooLarge;
    }
    const std::size_t cost = append_cost(ts_ns, line.size());
    if (size() + cost > target_size_) {
        return AppendResult::Full;
    }

    head_.push_back(HeadEntry{ts_ns, std::string(line)});
    head_bytes_ += cost;
    if (entries_ == 0) {
        min_ts_ = ts_ns;
        max_ts_ = ts_ns;
    } else {
        min_ts_ = std::min(min_ts_, ts_ns);
        max_ts_ = std::max(max_ts_, ts_ns);
    }
    ++entries_;

    if (head_bytes_ >= block_size_) {
        seal_head();
    }
    return AppendResult::Ok;
}

bool BlockChunk::space_for(std::int64_t ts_ns, std::string_view line) const noexcept {
    return !closed_ && size() + append_cost(ts_ns, line.size()) <= target_size_;
}

std::pair<std::int64_t, std::int64_t> BlockChunk::bounds() const noexcept {
    return {min_ts_, max_ts_};
}

double BlockChunk::utilization() const noexcept {
    const double u = static_cast<double>(size()) / static_cast<double>(target_size_);
    return std::min(1.0, u);
}

void BlockChunk::close() {
    if (closed_) {
        return;
    }
    seal_head();
    closed_ = true;
}

void BlockChunk::seal_head() {
    if (head_.empty()) {
        return;
    }
    Block block;
    block.entries = head_.size();
    block.bytes.reserve(head_bytes_);
    encode_block(head_, block.bytes);
    const std::uint32_t crc = util::Crc32c::compute(block.bytes.data(), block.bytes.size());
    util::append_le<std::uint32_t>(block.bytes, crc);

    sealed_bytes_ += block.bytes.size();
    blocks_.push_back(std::move(block));
    head_.clear();
    head_bytes_ = 0;
}

bool BlockChunk::for_each(const EntryVisitor& visit) const {
    for (const auto& block : blocks_) {
        if (block.bytes.size() < crc_size) {
            return false;
        }
        const std::size_t payload = block.bytes.size() - crc_size;
        const auto stored = util::load_le<std::uint32_t>(block.bytes.data() + payload);
        if (util::Crc32c::compute(block.bytes.data(), payload) != stored) {
            return false;
        }
        switch (decode_block(std::span<const std::byte>(block.bytes.data(), payload), visit)) {
        case DecodeStatus::Ok: break;
        case DecodeStatus::Stopped: return true;
        case DecodeStatus::Corrupt: return false;
        }
    }
    for (const auto& e : head_) {
        if (!visit(e.ts_ns, e.line)) {
            return true;
        }
    }
    return true;
}

bool BlockChunk::corrupt_block_for_test(std::size_t block, std::size_t offset) noexcept {
    if (block >= blocks_.size() || offset >= blocks_[block].bytes.size()) {
        return false;
    }
    blocks_[block].bytes[offset] ^= std::byte{0xFF};
    return true;
}

// ---- RawChunk ----

std::size_t RawChunk::block_header_size() const noexcept { return sizeof(std::uint32_t); }

std::size_t RawChunk::entry_size(std::int64_t, std::int64_t, std::size_t line_len) const noexcept {
    return sizeof(std::uint64_t) + sizeof(std::uint32_t) + line_len;
}

void RawChunk::encode_block(const std::vector<HeadEntry>& entries, std::vector<std::byte>& out) const {
    util::append_le<std::uint32_t>(out, static_cast<std::uint32_t>(entries.size()));
    for (const auto& e : entries) {
        util::append_le<std::uint64_t>(out, static_cast<std::uint64_t>(e.ts_ns));
        util::append_le<std::uint32_t>(out, static_cast<std::uint32_t>(e.line.size()));
        util::append_bytes(out, e.line);
    }
}

BlockChunk::DecodeStatus RawChunk::decode_block(std::span<const std::byte> block, const EntryVisitor& visit) const {
    const std::byte* p = block.data();
    const std::byte* end = block.data() + block.size();
    if (end - p < 4) {
        return DecodeStatus::Corrupt;
    }
    const auto count = util::load_le<std::uint32_t>(p);
    p += 4;
    for (std::uint32_t i = 0; i < count; ++i) {
        if (end - p < 12) {
            return DecodeStatus::Corrupt;
        }
        const auto ts = static_cast<std::int64_t>(util::load_le<std::uint64_t>(p));
        const auto len = util::load_le<std::uint32_t>(p + 8);
        p += 12;
        if (static_cast<std::size_t>(end - p) < len) {
            return DecodeStatus::Corrupt;
        }
        if (!visit(ts, as_line(p, len))) {
            return DecodeStatus::Stopped;
        }
        p += len;
    }
    return p == end ? DecodeStatus::Ok : DecodeStatus::Corrupt;
}

// ---- DeltaChunk ----

std::size_t DeltaChunk::block_header_size() const noexcept {
    return sizeof(std::uint64_t) + sizeof(std::uint32_t);
}

std::size_t DeltaChunk::entry_size(std::int64_t prev_ts, std::int64_t ts, std::size_t line_len) const noexcept {
    return util::uvarint_size(util::zigzag_encode(wrapping_sub(ts, prev_ts))) +
           util::uvarint_size(line_len) + line_len;
}

void DeltaChunk::encode_block(const std::vector<HeadEntry>& entries, std::vector<std::byte>& out) const {
    const std::int64_t first = entries.empty() ? 0 : entries.front().ts_ns;
    util::append_le<std::uint64_t>(out, static_cast<std::uint64_t>(first));
    util::append_le<std::uint32_t>(out, static_cast<std::uint32_t>(entries.size()));
    std::int64_t prev = first;
    for (const auto& e : entries) {
        util::append_uvarint(out, util::zigzag_encode(wrapping_sub(e.ts_ns, prev)));
        util::append_uvarint(out, e.line.size());
        util::append_bytes(out, e.line);
        prev = e.ts_ns;
    }
}

BlockChunk::DecodeStatus DeltaChunk::decode_block(std::span<const std::byte> block, const EntryVisitor& visit) const {
    const std::byte* p = block.data();
    const std::byte* end = block.data() + block.size();
    if (static_cast<std::size_t>(end - p) < block_header_size()) {
        return DecodeStatus::Corrupt;
    }
    std::int64_t prev = static_cast<std::int64_t>(util::load_le<std::uint64_t>(p));
    const auto count = util::load_le<std::uint32_t>(p + 8);
    p += block_header_size();
    for (std::uint32_t i = 0; i < count; ++i) {
        std::uint64_t delta = 0;
        std::uint64_t len = 0;
        if (!util::read_uvarint(p, end, delta) || !util::read_uvarint(p, end, len)) {
            return DecodeStatus::Corrupt;
        }
        if (static_cast<std::uint64_t>(end - p) < len) {
            return DecodeStatus::Corrupt;
        }
        prev = wrapping_add(prev, util::zigzag_decode(delta));
        if (!visit(prev, as_line(p, static_cast<std::size_t>(len)))) {
            return DecodeStatus::Stopped;
        }
        p += len;
    }
    return p == end ? DecodeStatus::Ok : DecodeStatus::Corrupt;
}

} // namespace chunk
