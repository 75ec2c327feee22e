#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/status.hpp"

namespace core {

using Fingerprint = std::uint64_t;

struct Label {
    std::string name;
    std::string value;

    bool operator==(const Label&) const = default;
};

struct CanonicalLabels;

// Sorts by name and fingerprints the sorted form. Duplicate names are the
// caller's problem; parse_labels() rejects them.
CanonicalLabels canonicalize(std::vector<Label> pairs);

// Name-sorted label pairs. Only canonicalize() builds a non-empty LabelSet, so
// two LabelSets compare equal iff their canonical forms are identical.
class LabelSet {
public:
    LabelSet() = default;

    const std::vector<Label>& labels() const noexcept { return labels_; }
    std::size_t size() const noexcept { return labels_.size(); }
    bool empty() const noexcept { return labels_.empty(); }

    std::optional<std::string_view> get(std::string_view name) const noexcept;

    // Display form: {a="1", b="2"}
    std::string to_string() const;

    bool operator==(const LabelSet&) const = default;

private:
    friend CanonicalLabels canonicalize(std::vector<Label> pairs);
    explicit LabelSet(std::vector<Label> sorted) : labels_(std::move(sorted)) {}

    std::vector<Label> labels_;
};

struct CanonicalLabels {
    LabelSet labels;
    Fingerprint fingerprint{0};
};

// XOR over pairs of FNV-1a(name, 0xFF, value). Order independent, cheap, and
// known to collide for distinct label sets.
Fingerprint fast_fingerprint(const LabelSet& ls) noexcept;

// FNV-1a over the whole sorted sequence with 0xFF separators.
Fingerprint strong_fingerprint(const LabelSet& ls) noexcept;

enum class LabelParseResult : std::uint8_t {
    Ok,
    MissingBrace,
    EmptySet,
    InvalidName,
    MissingEquals,
    InvalidValue,
    DuplicateName,
    TrailingData,
};

const char* label_parse_result_name(LabelParseResult r) noexcept;

// Parses {name="value", ...} into raw pairs in declaration order.
LabelParseResult parse_label_pairs(std::string_view text, std::vector<Label>& out);

// parse_label_pairs + duplicate check + canonicalize. InvalidLabelSet on failure.
Status parse_labels(std::string_view text, CanonicalLabels& out);

} // namespace core
