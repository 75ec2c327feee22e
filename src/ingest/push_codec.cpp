#include "ingest/push_codec.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include "util/crc32c.hpp"
#include "util/endian.hpp"

namespace ingest {
namespace {

constexpr std::size_t min_group_size = 2 * sizeof(std::uint32_t);
constexpr std::size_t min_entry_size = sizeof(std::int64_t) + sizeof(std::uint32_t);

std::uint32_t frame_crc(std::uint32_t payload_len, std::span<const std::byte> payload) noexcept {
    std::byte len_le[sizeof(std::uint32_t)];
    util::store_le(payload_len, len_le);
    std::uint32_t crc = util::Crc32c::initial;
    crc = util::Crc32c::update(crc, len_le, sizeof(len_le));
    crc = util::Crc32c::update(crc, payload.data(), payload.size());
    return util::Crc32c::finalize(crc);
}

class PayloadReader {
public:
    explicit PayloadReader(std::span<const std::byte> bytes) noexcept
        : p_(bytes.data()), end_(bytes.data() + bytes.size()) {}

    template <typename T>
    bool read(T& out) noexcept {
        if (remaining() < sizeof(T)) {
            return false;
        }
        out = util::load_le<T>(p_);
        p_ += sizeof(T);
        return true;
    }

    bool read_string(std::size_t len, std::string& out) {
        if (remaining() < len) {
            return false;
        }
        out.assign(reinterpret_cast<const char*>(p_), len);
        p_ += len;
        return true;
    }

    std::size_t remaining() const noexcept { return static_cast<std::size_t>(end_ - p_); }

private:
    const std::byte* p_;
    const std::byte* end_;
};

} // namespace

const char* decode_result_name(DecodeResult r) noexcept {
    switch (r) {
        case DecodeResult::Ok: return "Ok";
        case DecodeResult::Truncated: return "Truncated";
        case DecodeResult::Oversize: return "Oversize";
        case DecodeResult::BadChecksum: return "BadChecksum";
        case DecodeResult::Malformed: return "Malformed";
        case DecodeResult::EmptyTenant: return "EmptyTenant";
    }
    return "Unknown";
}

std::size_t push_payload_size(std::string_view tenant, const core::PushRequest& req) noexcept {
    std::size_t n = sizeof(std::uint16_t) + tenant.size() + sizeof(std::uint32_t);
    for (const auto& group : req.streams) {
        n += min_group_size + group.labels.size();
        for (const auto& e : group.entries) {
            n += min_entry_size + e.line.size();
        }
    }
    return n;
}

bool encode_push_frame(std::string_view tenant, const core::PushRequest& req, std::vector<std::byte>& out,
                       std::string& error) {
    if (tenant.size() > std::numeric_limits<std::uint16_t>::max()) {
        error = "tenant id longer than 65535 bytes";
        return false;
    }
    const std::size_t payload_len = push_payload_size(tenant, req);
    if (payload_len > max_push_payload_size) {
        error = "push payload of " + std::to_string(payload_len) + " bytes exceeds limit";
        return false;
    }

    const std::size_t frame_start = out.size();
    out.reserve(frame_start + payload_len + push_frame_overhead);
    util::append_le(out, static_cast<std::uint32_t>(payload_len));
    util::append_le(out, static_cast<std::uint16_t>(tenant.size()));
    util::append_bytes(out, tenant);
    util::append_le(out, static_cast<std::uint32_t>(req.streams.size()));
    for (const auto& group : req.streams) {
        util::append_le(out, static_cast<std::uint32_t>(group.labels.size()));
        util::append_bytes(out, group.labels);
        util::append_le(out, static_cast<std::uint32_t>(group.entries.size()));
        for (const auto& e : group.entries) {
            util::append_le(out, e.timestamp_ns);
            util::append_le(out, static_cast<std::uint32_t>(e.line.size()));
            util::append_bytes(out, e.line);
        }
    }

    const std::span<const std::byte> payload(out.data() + frame_start + sizeof(std::uint32_t), payload_len);
    util::append_le(out, frame_crc(static_cast<std::uint32_t>(payload_len), payload));
    return true;
}

DecodeResult decode_push_payload(std::span<const std::byte> payload, DecodedPush& out) {
    PayloadReader r(payload);
    DecodedPush decoded;

    std::uint16_t tenant_len = 0;
    if (!r.read(tenant_len) || !r.read_string(tenant_len, decoded.tenant)) {
        return DecodeResult::Malformed;
    }
    if (decoded.tenant.empty()) {
        return DecodeResult::EmptyTenant;
    }

    std::uint32_t group_count = 0;
    if (!r.read(group_count) || group_count > r.remaining() / min_group_size) {
        return DecodeResult::Malformed;
    }
    decoded.request.streams.resize(group_count);
    for (auto& group : decoded.request.streams) {
        std::uint32_t labels_len = 0;
        std::uint32_t entry_count = 0;
        if (!r.read(labels_len) || !r.read_string(labels_len, group.labels) || !r.read(entry_count) ||
            entry_count > r.remaining() / min_entry_size) {
            return DecodeResult::Malformed;
        }
        group.entries.resize(entry_count);
        for (auto& e : group.entries) {
            std::uint32_t line_len = 0;
            if (!r.read(e.timestamp_ns) || !r.read(line_len) || !r.read_string(line_len, e.line)) {
                return DecodeResult::Malformed;
            }
        }
    }
    if (r.remaining() != 0) {
        return DecodeResult::Malformed;
    }

    out = std::move(decoded);
    return DecodeResult::Ok;
}

DecodeResult decode_push_frame(std::span<const std::byte> bytes, DecodedPush& out, std::size_t& consumed) {
    if (bytes.size() < push_frame_overhead) {
        return DecodeResult::Truncated;
    }
    const auto payload_len = util::load_le<std::uint32_t>(bytes.data());
    if (payload_len > max_push_payload_size) {
        return DecodeResult::Oversize;
    }
    const std::size_t total = push_frame_overhead + payload_len;
    if (bytes.size() < total) {
        return DecodeResult::Truncated;
    }

    const auto payload = bytes.subspan(sizeof(std::uint32_t), payload_len);
    const auto stored_crc = util::load_le<std::uint32_t>(bytes.data() + sizeof(std::uint32_t) + payload_len);
    if (stored_crc != frame_crc(payload_len, payload)) {
        return DecodeResult::BadChecksum;
    }

    const DecodeResult res = decode_push_payload(payload, out);
    if (res == DecodeResult::Ok) {
        consumed = total;
    }
    return res;
}

} // namespace ingest
