#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "core/push.hpp"

namespace ingest {

// Push frame as carried by one transport message:
//   [u32 payload_len_le][payload][u32 crc32c_le]
// The checksum covers the little-endian length prefix and the payload.
//
// Payload layout (little-endian):
//   u16 tenant_len, tenant bytes
//   u32 group_count
//   per group:  u32 labels_len, labels bytes, u32 entry_count
//   per entry:  i64 ts_ns, u32 line_len, line bytes
inline constexpr std::size_t max_push_payload_size = 4u * 1024u * 1024u;
inline constexpr std::size_t push_frame_overhead = 2 * sizeof(std::uint32_t);

enum class DecodeResult : std::uint8_t {
    Ok,
    Truncated,     // fewer bytes than the length prefix promises
    Oversize,      // length prefix above max_push_payload_size
    BadChecksum,
    Malformed,     // payload fields overrun the payload or leave bytes behind
    EmptyTenant,
};

const char* decode_result_name(DecodeResult r) noexcept;

struct DecodedPush {
    std::string tenant;
    core::PushRequest request;
};

std::size_t push_payload_size(std::string_view tenant, const core::PushRequest& req) noexcept;

// Appends one frame to `out`. Fails (leaving `out` unchanged) when the tenant
// id does not fit its u16 prefix or the payload exceeds the size limit.
bool encode_push_frame(std::string_view tenant, const core::PushRequest& req, std::vector<std::byte>& out,
                       std::string& error);

DecodeResult decode_push_payload(std::span<const std::byte> payload, DecodedPush& out);

// Decodes the frame at the start of `bytes`. On Ok, `consumed` is the frame's
// total size; bytes after it are left to the caller.
DecodeResult decode_push_frame(std::span<const std::byte> bytes, DecodedPush& out, std::size_t& consumed);

} // namespace ingest
