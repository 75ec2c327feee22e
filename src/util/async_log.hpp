#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

#include "util/log.hpp"

namespace util {

// Fixed-size record so producers never allocate. Tenant ids and messages longer
// than the inline buffers are truncated.
struct LogRecord {
    std::uint64_t timestamp_ns{0};
    LogLevel level{LogLevel::Info};
    std::uint32_t thread_id_hash{0};
    char category[8]{};
    std::uint8_t tenant_len{0};
    char tenant[40]{};
    std::uint64_t fingerprint{0};
    std::uint16_t message_len{0};
    char message[176]{};
};

// Multi-producer, single-consumer logger for the ingest path. Push workers call
// try_log/try_logf concurrently; a single consumer thread drains to stderr or
// a file. A full ring drops the record and bumps dropped().
class AsyncLogger {
public:
    struct Config {
        std::size_t capacity_pow2{1u << 12};
        LogLevel min_level{LogLevel::Info};
        bool flush_on_warn{true};
        std::size_t flush_every{256};
        std::string file_path{}; // stderr when empty
        std::uint64_t consumer_sleep_ns{50'000};
    };

    AsyncLogger() = default;
    ~AsyncLogger();

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    bool start(const Config& cfg) noexcept;
    void stop() noexcept;
    bool running() const noexcept { return !stop_.load(std::memory_order_acquire); }

    bool enabled(LogLevel lvl) const noexcept {
        return static_cast<int>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    bool try_log(LogLevel lvl, std::string_view category, std::string_view tenant,
                 std::uint64_t fingerprint, std::string_view msg) noexcept;

    bool try_logf(LogLevel lvl, std::string_view category, std::string_view tenant,
                  std::uint64_t fingerprint, const char* fmt, ...) noexcept;

    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }
    std::uint64_t written() const noexcept { return written_.load(std::memory_order_relaxed); }

private:
    struct Slot {
        std::atomic<std::uint64_t> sequence{0};
        LogRecord record{};
    };

    bool try_pop(LogRecord& out) noexcept;
    void consumer_loop() noexcept;
    void write_record(const LogRecord& rec) noexcept;
    static bool is_power_of_two(std::size_t v) noexcept { return v != 0 && (v & (v - 1)) == 0; }

    std::atomic<std::uint64_t> head_{0};
    std::uint64_t tail_{0};
    std::size_t mask_{0};
    std::unique_ptr<Slot[]> slots_{};

    std::atomic<bool> stop_{true};
    std::atomic<int> min_level_{static_cast<int>(LogLevel::Info)};
    std::thread consumer_{};
    Config config_{};

    FILE* sink_{stderr};
    bool owns_file_{false};

    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> written_{0};
};

AsyncLogger& ingest_logger() noexcept;
bool init_ingest_logger(const AsyncLogger::Config& cfg) noexcept;
void shutdown_ingest_logger() noexcept;

} // namespace util

// Formatting happens on the caller thread; keep these off per-entry loops.
#define LOG_WARM_FMT(LVL, CAT, TENANT, FP, FMT, ...)                                               \
    do {                                                                                           \
        auto& _lg = ::util::ingest_logger();                                                       \
        if (_lg.enabled(LVL)) {                                                                    \
            _lg.try_logf((LVL), (CAT), (TENANT), (FP), (FMT) __VA_OPT__(, __VA_ARGS__));           \
        }                                                                                          \
    } while (0)

#define LOG_INGEST_DEBUG(CAT, TENANT, FP, FMT, ...) LOG_WARM_FMT(::util::LogLevel::Debug, CAT, TENANT, FP, FMT __VA_OPT__(, __VA_ARGS__))
#define LOG_INGEST_INFO(CAT, TENANT, FP, FMT, ...)  LOG_WARM_FMT(::util::LogLevel::Info,  CAT, TENANT, FP, FMT __VA_OPT__(, __VA_ARGS__))
#define LOG_INGEST_WARN(CAT, TENANT, FP, FMT, ...)  LOG_WARM_FMT(::util::LogLevel::Warn,  CAT, TENANT, FP, FMT __VA_OPT__(, __VA_ARGS__))
#define LOG_INGEST_ERROR(CAT, TENANT, FP, FMT, ...) LOG_WARM_FMT(::util::LogLevel::Error, CAT, TENANT, FP, FMT __VA_OPT__(, __VA_ARGS__))
