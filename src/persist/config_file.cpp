#include "persist/config_file.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <utility>

namespace persist {
namespace {

class JsonCursor {
public:
    explicit JsonCursor(std::string_view s) : src_(s) {}

    void skip_ws() noexcept {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (pos_ < src_.size() && src_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    std::optional<std::string> parse_string(std::string& err) {
        skip_ws();
        if (pos_ >= src_.size() || src_[pos_] != '"') {
            err = "expected string at offset " + std::to_string(pos_);
            return std::nullopt;
        }
        ++pos_;
        std::string out;
        while (pos_ < src_.size()) {
            const char c = src_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= src_.size()) {
                break;
            }
            switch (src_[pos_++]) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                default:
                    err = "unsupported escape sequence";
                    return std::nullopt;
            }
        }
        err = "unterminated string";
        return std::nullopt;
    }

    std::optional<std::uint64_t> parse_uint64(std::string& err) {
        skip_ws();
        std::size_t end = pos_;
        while (end < src_.size() && std::isdigit(static_cast<unsigned char>(src_[end]))) {
            ++end;
        }
        std::uint64_t value = 0;
        const auto conv = std::from_chars(src_.data() + pos_, src_.data() + end, value);
        if (end == pos_ || conv.ec != std::errc() || conv.ptr != src_.data() + end) {
            err = "expected unsigned integer at offset " + std::to_string(pos_);
            return std::nullopt;
        }
        pos_ = end;
        return value;
    }

    std::optional<double> parse_number(std::string& err) {
        skip_ws();
        double value = 0.0;
        const auto conv = std::from_chars(src_.data() + pos_, src_.data() + src_.size(), value);
        if (conv.ec != std::errc()) {
            err = "expected number at offset " + std::to_string(pos_);
            return std::nullopt;
        }
        pos_ = static_cast<std::size_t>(conv.ptr - src_.data());
        return value;
    }

    bool eof() noexcept {
        skip_ws();
        return pos_ >= src_.size();
    }

private:
    std::size_t pos_{0};
    std::string_view src_;
};

// Walks `{ "key": <value>, ... }`, handing each key to `member`, which must
// consume the value. `member` returns false after setting `error`.
template <typename Fn>
bool parse_object(JsonCursor& cur, std::string_view what, std::string& error, Fn&& member) {
    if (!cur.consume('{')) {
        error = "expected object for " + std::string(what);
        return false;
    }
    if (cur.consume('}')) {
        return true;
    }
    while (true) {
        auto key = cur.parse_string(error);
        if (!key) {
            return false;
        }
        if (!cur.consume(':')) {
            error = "expected ':' after " + std::string(what) + "." + *key;
            return false;
        }
        if (!member(*key)) {
            return false;
        }
        if (cur.consume('}')) {
            return true;
        }
        if (!cur.consume(',')) {
            error = "expected ',' in " + std::string(what);
            return false;
        }
    }
}

template <typename T>
bool parse_bounded(JsonCursor& cur, const std::string& key, std::uint64_t lo, std::uint64_t hi, T& out,
                   std::string& error) {
    auto v = cur.parse_uint64(error);
    if (!v) {
        return false;
    }
    if (*v < lo || *v > hi) {
        error = key + " out of range [" + std::to_string(lo) + ", " + std::to_string(hi) + "]";
        return false;
    }
    out = static_cast<T>(*v);
    return true;
}

bool parse_limits(JsonCursor& cur, std::string_view what, core::Limits& out, std::string& error,
                  bool* seen_max = nullptr) {
    return parse_object(cur, what, error, [&](const std::string& key) {
        if (key == "max_local_streams_per_user") {
            if (seen_max) *seen_max = true;
            return parse_bounded(cur, key, 0, std::numeric_limits<std::uint32_t>::max(),
                                 out.max_local_streams_per_user, error);
        }
        error = "unknown " + std::string(what) + " field: " + key;
        return false;
    });
}

bool parse_ingester(JsonCursor& cur, core::IngesterConfig& cfg, std::string& error) {
    constexpr std::uint64_t max_period_ms = std::numeric_limits<std::int64_t>::max() / 1'000'000;
    return parse_object(cur, "ingester", error, [&](const std::string& key) {
        if (key == "sync_period_ms") {
            std::uint64_t ms = 0;
            if (!parse_bounded(cur, key, 0, max_period_ms, ms, error)) return false;
            cfg.sync_period_ns = static_cast<std::int64_t>(ms) * 1'000'000;
            return true;
        }
        if (key == "sync_min_utilization") {
            auto v = cur.parse_number(error);
            if (!v) return false;
            if (!(*v >= 0.0 && *v <= 1.0)) {
                error = "sync_min_utilization must be within [0, 1]";
                return false;
            }
            cfg.sync_min_utilization = *v;
            return true;
        }
        if (key == "block_size") {
            return parse_bounded(cur, key, 1, std::numeric_limits<std::uint32_t>::max(), cfg.chunk.block_size, error);
        }
        if (key == "target_size") {
            return parse_bounded(cur, key, 1, std::numeric_limits<std::uint32_t>::max(), cfg.chunk.target_size, error);
        }
        if (key == "encoding") {
            auto v = cur.parse_string(error);
            if (!v) return false;
            auto enc = chunk::encoding_from_string(*v);
            if (!enc) {
                error = "unknown encoding: " + *v;
                return false;
            }
            cfg.chunk.encoding = *enc;
            return true;
        }
        if (key == "replication_factor") {
            return parse_bounded(cur, key, 1, 64, cfg.replication_factor, error);
        }
        if (key == "replica_count") {
            return parse_bounded(cur, key, 0, 1u << 16, cfg.replica_count, error);
        }
        if (key == "out_of_order") {
            auto v = cur.parse_string(error);
            if (!v) return false;
            auto policy = core::out_of_order_policy_from_string(*v);
            if (!policy) {
                error = "unknown out_of_order policy: " + *v;
                return false;
            }
            cfg.out_of_order = *policy;
            return true;
        }
        if (key == "push_workers") {
            return parse_bounded(cur, key, 1, 256, cfg.push_workers, error);
        }
        error = "unknown ingester field: " + key;
        return false;
    });
}

bool parse_log(JsonCursor& cur, LogSettings& log, std::string& error) {
    return parse_object(cur, "log", error, [&](const std::string& key) {
        auto v = cur.parse_string(error);
        if (!v) return false;
        if (key == "level") {
            auto lvl = util::level_from_string(*v);
            if (!lvl) {
                error = "unknown log level: " + *v;
                return false;
            }
            log.level = *lvl;
            return true;
        }
        if (key == "file") {
            log.file = std::move(*v);
            return true;
        }
        error = "unknown log field: " + key;
        return false;
    });
}

bool load_file(const std::filesystem::path& path, std::string& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "failed to open " + path.string();
        return false;
    }
    in.seekg(0, std::ios::end);
    const auto len = in.tellg();
    if (len < 0) {
        error = "failed to size " + path.string();
        return false;
    }
    out.resize(static_cast<std::size_t>(len));
    in.seekg(0, std::ios::beg);
    if (!in.read(out.data(), static_cast<std::streamsize>(out.size()))) {
        error = "failed to read " + path.string();
        return false;
    }
    return true;
}

} // namespace

bool parse_config_text(std::string_view text, DaemonConfig& out, std::string& error) noexcept {
    DaemonConfig cfg;
    JsonCursor cur(text);
    const bool parsed = parse_object(cur, "config", error, [&](const std::string& key) {
        if (key == "ingester") {
            return parse_ingester(cur, cfg.ingester, error);
        }
        if (key == "limits") {
            return parse_limits(cur, "limits", cfg.limits, error);
        }
        if (key == "overrides") {
            return parse_object(cur, "overrides", error, [&](const std::string& tenant) {
                if (tenant.empty()) {
                    error = "override tenant must not be empty";
                    return false;
                }
                core::Limits limits;
                bool seen_max = false;
                if (!parse_limits(cur, "overrides." + tenant, limits, error, &seen_max)) {
                    return false;
                }
                if (!seen_max) {
                    error = "overrides." + tenant + " sets no limit";
                    return false;
                }
                cfg.overrides.insert_or_assign(tenant, limits);
                return true;
            });
        }
        if (key == "log") {
            return parse_log(cur, cfg.log, error);
        }
        error = "unknown field: " + key;
        return false;
    });
    if (!parsed) {
        return false;
    }
    if (!cur.eof()) {
        error = "trailing data after config object";
        return false;
    }
    if (cfg.ingester.chunk.block_size > cfg.ingester.chunk.target_size) {
        error = "block_size must not exceed target_size";
        return false;
    }
    out = std::move(cfg);
    return true;
}

bool parse_config_file(const std::filesystem::path& path, DaemonConfig& out, std::string& error) noexcept {
    std::string contents;
    if (!load_file(path, contents, error)) {
        return false;
    }
    if (!parse_config_text(contents, out, error)) {
        error = path.string() + ": " + error;
        return false;
    }
    return true;
}

} // namespace persist
