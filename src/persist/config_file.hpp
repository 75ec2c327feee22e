#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "core/ingester_config.hpp"
#include "core/limits.hpp"
#include "util/log.hpp"

namespace persist {

struct LogSettings {
    util::LogLevel level{util::LogLevel::Info};
    std::string file; // ingest log goes to stderr when empty
};

// Everything ingesterd reads from its JSON config file. Fields absent from the
// file keep the defaults below.
struct DaemonConfig {
    core::IngesterConfig ingester{core::default_ingester_config()};
    core::Limits limits{};
    core::Overrides::TenantMap overrides;
    LogSettings log;
};

// Schema-specific JSON readers. Unknown keys, wrong value types and values out
// of range are errors; nothing is written to `out` on failure. Do not throw.
//
//   {
//     "ingester": {"sync_period_ms": 900000, "sync_min_utilization": 0.2,
//                  "block_size": 262144, "target_size": 1572864,
//                  "encoding": "delta", "replication_factor": 1,
//                  "replica_count": 1, "out_of_order": "accept",
//                  "push_workers": 4},
//     "limits": {"max_local_streams_per_user": 10000},
//     "overrides": {"tenant-a": {"max_local_streams_per_user": 50}},
//     "log": {"level": "info", "file": ""}
//   }
bool parse_config_text(std::string_view text, DaemonConfig& out, std::string& error) noexcept;

bool parse_config_file(const std::filesystem::path& path, DaemonConfig& out, std::string& error) noexcept;

} // namespace persist
