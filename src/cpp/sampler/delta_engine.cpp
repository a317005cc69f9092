#include "delta_engine.hpp"
#include "../utils/logger.hpp"

#include <algorithm>

namespace nodestat {
namespace delta {

int64_t rate(int64_t current, int64_t previous, double interval_seconds) {
    if (interval_seconds <= 0.0) {
        LOG_WRN("[delta] Non-positive interval %.3f s, reporting rate 0", interval_seconds);
        return 0;
    }
    if (current < previous) {
        LOG_DBG("[delta] Counter reset (%lld -> %lld)",
            static_cast<long long>(previous), static_cast<long long>(current));
        return 0;
    }
    int64_t diff = current - previous;
    // Whole-second intervals stay in integer arithmetic (exact for any counter)
    auto whole = static_cast<int64_t>(interval_seconds);
    if (static_cast<double>(whole) == interval_seconds) {
        return diff / whole;
    }
    return static_cast<int64_t>(static_cast<double>(diff) / interval_seconds);
}

int64_t delta(int64_t current, int64_t previous) {
    return current < previous ? 0 : current - previous;
}

double elapsed_seconds(SteadyClock::time_point from, SteadyClock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

// Unsigned counters: treat a decrease as a reset, same as rate()
static uint64_t udelta(uint64_t current, uint64_t previous) {
    return current < previous ? 0 : current - previous;
}

static int64_t urate(uint64_t current, uint64_t previous, uint64_t scale_num,
                     uint64_t scale_den, double interval_seconds) {
    if (interval_seconds <= 0.0) return 0;
    double d = static_cast<double>(udelta(current, previous)) * scale_num / scale_den;
    return static_cast<int64_t>(d / interval_seconds);
}

CpuBreakdown cpu_breakdown(const CpuCounters& prev, const CpuCounters& cur) {
    CpuBreakdown b;
    uint64_t total = udelta(cur.total(), prev.total());
    if (total == 0) return b;

    auto pct = [total](uint64_t d) {
        return 100.0 * static_cast<double>(d) / static_cast<double>(total);
    };
    b.user_pct   = pct(udelta(cur.user, prev.user) + udelta(cur.nice, prev.nice));
    b.system_pct = pct(udelta(cur.system, prev.system) + udelta(cur.irq, prev.irq)
                       + udelta(cur.softirq, prev.softirq));
    b.iowait_pct = pct(udelta(cur.iowait, prev.iowait));
    b.idle_pct   = pct(udelta(cur.idle, prev.idle) + udelta(cur.steal, prev.steal));
    return b;
}

DiskRates disk_rates(const DiskCounters& prev, const DiskCounters& cur, double interval_seconds) {
    DiskRates r;
    if (interval_seconds <= 0.0) return r;

    r.reads_per_sec    = urate(cur.reads_completed, prev.reads_completed, 1, 1, interval_seconds);
    r.writes_per_sec   = urate(cur.writes_completed, prev.writes_completed, 1, 1, interval_seconds);
    r.read_kb_per_sec  = urate(cur.sectors_read, prev.sectors_read, kSectorBytes, 1024, interval_seconds);
    r.write_kb_per_sec = urate(cur.sectors_written, prev.sectors_written, kSectorBytes, 1024, interval_seconds);

    double busy_ms = static_cast<double>(udelta(cur.io_ticks_ms, prev.io_ticks_ms));
    r.util_pct = std::min(100.0, busy_ms / (interval_seconds * 1000.0) * 100.0);
    return r;
}

NetRates net_rates(const NetCounters& prev, const NetCounters& cur, double interval_seconds) {
    NetRates r;
    r.rx_kb_per_sec = urate(cur.rx_bytes, prev.rx_bytes, 1, 1024, interval_seconds);
    r.tx_kb_per_sec = urate(cur.tx_bytes, prev.tx_bytes, 1, 1024, interval_seconds);
    return r;
}

} // namespace delta
} // namespace nodestat
