#include "util/async_log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdarg>
#include <cstring>
#include <functional>
#include <new>
#include <system_error>

namespace util {
namespace {

AsyncLogger& global_ingest_logger() {
    static AsyncLogger logger;
    return logger;
}

std::uint64_t now_ns() noexcept {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

template <std::size_t N>
std::size_t copy_truncated(char (&dest)[N], std::string_view src) noexcept {
    const std::size_t n = std::min(N, src.size());
    if (n > 0) {
        std::memcpy(dest, src.data(), n);
    }
    return n;
}

} // namespace

AsyncLogger::~AsyncLogger() { stop(); }

bool AsyncLogger::start(const Config& cfg) noexcept {
    if (!is_power_of_two(cfg.capacity_pow2) || cfg.capacity_pow2 < 2) {
        return false;
    }
    if (running()) {
        return true;
    }

    config_ = cfg;
    head_.store(0, std::memory_order_relaxed);
    tail_ = 0;
    mask_ = cfg.capacity_pow2 - 1;
    min_level_.store(static_cast<int>(cfg.min_level), std::memory_order_relaxed);

    std::unique_ptr<Slot[]> fresh;
    try {
        fresh.reset(new Slot[cfg.capacity_pow2]);
    } catch (const std::bad_alloc&) {
        return false;
    }
    for (std::size_t i = 0; i < cfg.capacity_pow2; ++i) {
        fresh[i].sequence.store(i, std::memory_order_relaxed);
    }
    slots_ = std::move(fresh);

    if (!cfg.file_path.empty()) {
        sink_ = std::fopen(cfg.file_path.c_str(), "a");
        if (!sink_) {
            sink_ = stderr;
            return false;
        }
        owns_file_ = true;
    } else {
        sink_ = stderr;
        owns_file_ = false;
    }

    stop_.store(false, std::memory_order_release);
    try {
        consumer_ = std::thread([this] { consumer_loop(); });
    } catch (const std::system_error&) {
        stop_.store(true, std::memory_order_release);
        if (owns_file_) {
            std::fclose(sink_);
        }
        owns_file_ = false;
        sink_ = stderr;
        return false;
    }
    return true;
}

void AsyncLogger::stop() noexcept {
    if (stop_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (consumer_.joinable()) {
        consumer_.join();
    }
    if (owns_file_ && sink_) {
        std::fclose(sink_);
    }
    sink_ = stderr;
    owns_file_ = false;
}

bool AsyncLogger::try_log(LogLevel lvl, std::string_view category, std::string_view tenant,
                          std::uint64_t fingerprint, std::string_view msg) noexcept {
    if (!running() || !slots_ || !enabled(lvl)) {
        return false;
    }

    std::uint64_t pos = head_.load(std::memory_order_relaxed);
    for (;;) {
        Slot& slot = slots_[pos & mask_];
        const std::uint64_t seq = slot.sequence.load(std::memory_order_acquire);
        const auto dif = static_cast<std::int64_t>(seq) - static_cast<std::int64_t>(pos);
        if (dif == 0) {
            if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed, std::memory_order_relaxed)) {
                break;
            }
        } else if (dif < 0) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false; // full
        } else {
            pos = head_.load(std::memory_order_relaxed);
        }
    }

    static thread_local const std::uint32_t tid_hash =
        static_cast<std::uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));

    Slot& slot = slots_[pos & mask_];
    LogRecord& rec = slot.record;
    rec = LogRecord{};
    rec.timestamp_ns = now_ns();
    rec.level = lvl;
    rec.thread_id_hash = tid_hash;
    copy_truncated(rec.category, category);
    rec.tenant_len = static_cast<std::uint8_t>(copy_truncated(rec.tenant, tenant));
    rec.fingerprint = fingerprint;
    rec.message_len = static_cast<std::uint16_t>(copy_truncated(rec.message, msg));

    slot.sequence.store(pos + 1, std::memory_order_release);
    return true;
}

bool AsyncLogger::try_logf(LogLevel lvl, std::string_view category, std::string_view tenant,
                           std::uint64_t fingerprint, const char* fmt, ...) noexcept {
    char buffer[sizeof(LogRecord::message)];
    va_list args;
    va_start(args, fmt);
    const int n = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    if (n < 0) {
        return false;
    }
    const std::size_t len = std::min<std::size_t>(static_cast<std::size_t>(n), sizeof(buffer) - 1);
    return try_log(lvl, category, tenant, fingerprint, std::string_view(buffer, len));
}

bool AsyncLogger::try_pop(LogRecord& out) noexcept {
    Slot& slot = slots_[tail_ & mask_];
    const std::uint64_t seq = slot.sequence.load(std::memory_order_acquire);
    const auto dif = static_cast<std::int64_t>(seq) - static_cast<std::int64_t>(tail_ + 1);
    if (dif != 0) {
        return false;
    }
    out = slot.record;
    slot.sequence.store(tail_ + mask_ + 1, std::memory_order_release);
    ++tail_;
    return true;
}

void AsyncLogger::write_record(const LogRecord& rec) noexcept {
    std::fprintf(sink_, "[%llu][%s][%u][%.*s]", static_cast<unsigned long long>(rec.timestamp_ns),
                 level_name(rec.level), static_cast<unsigned>(rec.thread_id_hash),
                 static_cast<int>(::strnlen(rec.category, sizeof(rec.category))), rec.category);
    if (rec.tenant_len > 0) {
        std::fprintf(sink_, " tenant=%.*s", static_cast<int>(rec.tenant_len), rec.tenant);
    }
    if (rec.fingerprint != 0) {
        std::fprintf(sink_, " fp=%016llx", static_cast<unsigned long long>(rec.fingerprint));
    }
    std::fputc(' ', sink_);
    std::fwrite(rec.message, 1, rec.message_len, sink_);
    std::fputc('\n', sink_);
}

void AsyncLogger::consumer_loop() noexcept {
    std::size_t since_flush = 0;
    std::uint32_t idle_spins = 0;
    while (running() || tail_ != head_.load(std::memory_order_acquire)) {
        LogRecord rec{};
        if (try_pop(rec)) {
            write_record(rec);
            written_.fetch_add(1, std::memory_order_relaxed);
            ++since_flush;
            idle_spins = 0;
            if ((config_.flush_on_warn && rec.level >= LogLevel::Warn) ||
                (config_.flush_every > 0 && since_flush >= config_.flush_every)) {
                std::fflush(sink_);
                since_flush = 0;
            }
            continue;
        }
        if (since_flush > 0) {
            std::fflush(sink_);
            since_flush = 0;
        }
        if (idle_spins < 64) {
            ++idle_spins;
            std::this_thread::yield();
        } else if (config_.consumer_sleep_ns > 0) {
            idle_spins = 0;
            std::this_thread::sleep_for(std::chrono::nanoseconds(config_.consumer_sleep_ns));
        }
    }
    std::fflush(sink_);
}

AsyncLogger& ingest_logger() noexcept { return global_ingest_logger(); }

bool init_ingest_logger(const AsyncLogger::Config& cfg) noexcept {
    return global_ingest_logger().start(cfg);
}

void shutdown_ingest_logger() noexcept { global_ingest_logger().stop(); }

} // namespace util
