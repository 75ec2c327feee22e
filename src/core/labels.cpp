#include "core/labels.hpp"

#include <algorithm>

namespace core {
namespace {

constexpr Fingerprint fnv_offset_basis = 14695981039346656037ULL;
constexpr Fingerprint fnv_prime = 1099511628211ULL;
constexpr std::uint8_t separator_byte = 0xFF;

inline Fingerprint fnv_add_byte(Fingerprint h, std::uint8_t b) noexcept {
    h ^= b;
    h *= fnv_prime;
    return h;
}

inline Fingerprint fnv_add(Fingerprint h, std::string_view s) noexcept {
    for (char c : s) {
        h = fnv_add_byte(h, static_cast<std::uint8_t>(c));
    }
    return h;
}

inline bool is_name_start(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

inline bool is_name_char(char c) noexcept {
    return is_name_start(c) || (c >= '0' && c <= '9');
}

inline void skip_ws(const char*& p, const char* end) noexcept {
    while (p < end && (*p == ' ' || *p == '\t' || *p == '\n' || *p == '\r')) ++p;
}

void append_escaped(std::string& out, std::string_view value) {
    for (char c : value) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        default: out.push_back(c); break;
        }
    }
}

} // namespace

std::optional<std::string_view> LabelSet::get(std::string_view name) const noexcept {
    const auto it = std::lower_bound(labels_.begin(), labels_.end(), name,
                                     [](const Label& l, std::string_view n) { return l.name < n; });
    if (it == labels_.end() || it->name != name) {
        return std::nullopt;
    }
    return std::string_view(it->value);
}

std::string LabelSet::to_string() const {
    std::string out;
    out.push_back('{');
    for (std::size_t i = 0; i < labels_.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += labels_[i].name;
        out += "=\"";
        append_escaped(out, labels_[i].value);
        out.push_back('"');
    }
    out.push_back('}');
    return out;
}

CanonicalLabels canonicalize(std::vector<Label> pairs) {
    std::stable_sort(pairs.begin(), pairs.end(),
                     [](const Label& a, const Label& b) { return a.name < b.name; });
    CanonicalLabels out;
    out.labels = LabelSet(std::move(pairs));
    out.fingerprint = fast_fingerprint(out.labels);
    return out;
}

Fingerprint fast_fingerprint(const LabelSet& ls) noexcept {
    if (ls.empty()) {
        return fnv_offset_basis;
    }
    Fingerprint result = 0;
    for (const auto& l : ls.labels()) {
        Fingerprint h = fnv_add(fnv_offset_basis, l.name);
        h = fnv_add_byte(h, separator_byte);
        h = fnv_add(h, l.value);
        result ^= h;
    }
    return result;
}

Fingerprint strong_fingerprint(const LabelSet& ls) noexcept {
    Fingerprint h = fnv_offset_basis;
    for (const auto& l : ls.labels()) {
        h = fnv_add(h, l.name);
        h = fnv_add_byte(h, separator_byte);
        h = fnv_add(h, l.value);
        h = fnv_add_byte(h, separator_byte);
    }
    return h;
}

const char* label_parse_result_name(LabelParseResult r) noexcept {
    switch (r) {
    case LabelParseResult::Ok: return "ok";
    case LabelParseResult::MissingBrace: return "missing brace";
    case LabelParseResult::EmptySet: return "empty label set";
    case LabelParseResult::InvalidName: return "invalid label name";
    case LabelParseResult::MissingEquals: return "missing '='";
    case LabelParseResult::InvalidValue: return "invalid quoted value";
    case LabelParseResult::DuplicateName: return "duplicate label name";
    case LabelParseResult::TrailingData: return "trailing data";
    }
    return "unknown";
}

LabelParseResult parse_label_pairs(std::string_view text, std::vector<Label>& out) {
    const char* p = text.data();
    const char* end = text.data() + text.size();

    skip_ws(p, end);
    if (p >= end || *p != '{') return LabelParseResult::MissingBrace;
    ++p;

    skip_ws(p, end);
    if (p < end && *p == '}') {
        ++p;
        skip_ws(p, end);
        return p == end ? LabelParseResult::EmptySet : LabelParseResult::TrailingData;
    }

    for (;;) {
        skip_ws(p, end);
        const char* name_start = p;
        if (p >= end || !is_name_start(*p)) return LabelParseResult::InvalidName;
        while (p < end && is_name_char(*p)) ++p;
        Label label;
        label.name.assign(name_start, p);

        skip_ws(p, end);
        if (p >= end || *p != '=') return LabelParseResult::MissingEquals;
        ++p;
        skip_ws(p, end);
        if (p >= end || *p != '"') return LabelParseResult::InvalidValue;
        ++p;

        bool closed = false;
        while (p < end) {
            const char c = *p++;
            if (c == '"') {
                closed = true;
                break;
            }
            if (c != '\\') {
                label.value.push_back(c);
                continue;
            }
            if (p >= end) return LabelParseResult::InvalidValue;
            switch (*p++) {
            case '"': label.value.push_back('"'); break;
            case '\\': label.value.push_back('\\'); break;
            case 'n': label.value.push_back('\n'); break;
            default: return LabelParseResult::InvalidValue;
            }
        }
        if (!closed) return LabelParseResult::InvalidValue;
        out.push_back(std::move(label));

        skip_ws(p, end);
        if (p < end && *p == ',') {
            ++p;
            continue;
        }
        if (p < end && *p == '}') {
            ++p;
            break;
        }
        return LabelParseResult::MissingBrace;
    }

    skip_ws(p, end);
    return p == end ? LabelParseResult::Ok : LabelParseResult::TrailingData;
}

Status parse_labels(std::string_view text, CanonicalLabels& out) {
    std::vector<Label> pairs;
    LabelParseResult res = parse_label_pairs(text, pairs);
    if (res == LabelParseResult::Ok) {
        CanonicalLabels canon = canonicalize(std::move(pairs));
        const auto& sorted = canon.labels.labels();
        const auto dup = std::adjacent_find(sorted.begin(), sorted.end(),
                                            [](const Label& a, const Label& b) { return a.name == b.name; });
        if (dup == sorted.end()) {
            out = std::move(canon);
            return Status::ok_status();
        }
        res = LabelParseResult::DuplicateName;
    }
    std::string msg = "failed to parse labels ";
    msg.append(text.data(), text.size());
    msg += ": ";
    msg += label_parse_result_name(res);
    return Status{ErrorCode::InvalidLabelSet, std::move(msg)};
}

} // namespace core
