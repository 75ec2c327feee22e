#include "chunk/chunk.hpp"

#include <stdexcept>

#include "chunk/block_chunk.hpp"

namespace chunk {

const char* encoding_name(Encoding e) noexcept {
    switch (e) {
    case Encoding::Raw: return "raw";
    case Encoding::Delta: return "delta";
    }
    return "unknown";
}

std::optional<Encoding> encoding_from_string(std::string_view s) noexcept {
    if (s == "raw") return Encoding::Raw;
    if (s == "delta") return Encoding::Delta;
    return std::nullopt;
}

const char* append_result_name(AppendResult r) noexcept {
    switch (r) {
    case AppendResult::Ok: return "ok";
    case AppendResult::Closed: return "chunk closed";
    case AppendResult::Full: return "chunk full";
    case AppendResult::TooLarge: return "entry too large for chunk";
    }
    return "unknown";
}

std::unique_ptr<Chunk> make_chunk(const ChunkConfig& cfg) {
    switch (cfg.encoding) {
    case Encoding::Raw: return std::make_unique<RawChunk>(cfg.block_size, cfg.target_size);
    case Encoding::Delta: return std::make_unique<DeltaChunk>(cfg.block_size, cfg.target_size);
    }
    throw std::invalid_argument("unknown chunk encoding");
}

ChunkFactory make_chunk_factory(const ChunkConfig& cfg) {
    make_chunk(cfg); // throws on a bad config
    return [cfg] { return make_chunk(cfg); };
}

} // namespace chunk
