#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace core {

struct Entry {
    std::int64_t timestamp_ns{0};
    std::string line;
};

// One entry group: a label string as declared by the client, e.g.
// {app="api", env="prod"}, in any pair order.
struct StreamPush {
    std::string labels;
    std::vector<Entry> entries;
};

struct PushRequest {
    std::vector<StreamPush> streams;
};

} // namespace core
