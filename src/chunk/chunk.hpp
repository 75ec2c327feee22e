#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace chunk {

enum class Encoding : std::uint8_t { Raw, Delta };

const char* encoding_name(Encoding e) noexcept;
std::optional<Encoding> encoding_from_string(std::string_view s) noexcept;

enum class AppendResult : std::uint8_t {
    Ok,
    Closed,   // chunk no longer accepts appends
    Full,     // entry does not fit under the target size
    TooLarge, // entry does not fit even in an empty chunk
};

const char* append_result_name(AppendResult r) noexcept;

// Return false to stop iteration early.
using EntryVisitor = std::function<bool(std::int64_t ts_ns, std::string_view line)>;

// Append-only buffer of timestamped lines. Empty -> Active on first append,
// Active -> Closed on close(); there is no way back.
// Not thread-safe: the owning Stream serializes access.
class Chunk {
public:
    virtual ~Chunk() = default;

    virtual AppendResult append(std::int64_t ts_ns, std::string_view line) = 0;
    virtual bool space_for(std::int64_t ts_ns, std::string_view line) const noexcept = 0;

    // (min, max) entry timestamp; (0, 0) while empty.
    virtual std::pair<std::int64_t, std::int64_t> bounds() const noexcept = 0;

    // Fraction of the target size in use, in [0, 1].
    virtual double utilization() const noexcept = 0;

    virtual std::size_t size() const noexcept = 0;
    virtual std::size_t entry_count() const noexcept = 0;

    virtual void close() = 0;
    virtual bool closed() const noexcept = 0;

    virtual Encoding encoding() const noexcept = 0;

    // Visits entries in append order. Returns false if a sealed block fails its
    // checksum or does not decode.
    virtual bool for_each(const EntryVisitor& visit) const = 0;
};

struct ChunkConfig {
    Encoding encoding{Encoding::Delta};
    std::size_t block_size{256 * 1024};
    std::size_t target_size{1536 * 1024};
};

using ChunkFactory = std::function<std::unique_ptr<Chunk>()>;

// Throws std::invalid_argument on a zero block/target size or a block size
// larger than the target size.
std::unique_ptr<Chunk> make_chunk(const ChunkConfig& cfg);
ChunkFactory make_chunk_factory(const ChunkConfig& cfg);

} // namespace chunk
