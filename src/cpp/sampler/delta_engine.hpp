#pragma once
// =============================================================================
// DeltaEngine -- cumulative counters to per-interval rates
//
// All counters handled here only ever grow while the monitored process
// lives. A counter that went DOWN means the process restarted: the rate for
// that cycle is reported as 0 and the caller keeps the new value as the
// baseline for the next cycle. No rate is ever negative.
// =============================================================================

#include <cstdint>
#include "../utils/timer.hpp"
#include "../sources/host_source.hpp"

namespace nodestat {

struct CpuBreakdown {
    double user_pct = 0.0;      // user + nice
    double system_pct = 0.0;    // system + irq + softirq
    double iowait_pct = 0.0;
    double idle_pct = 0.0;      // idle + steal
};

struct DiskRates {
    int64_t reads_per_sec = 0;
    int64_t writes_per_sec = 0;
    int64_t read_kb_per_sec = 0;
    int64_t write_kb_per_sec = 0;
    double util_pct = 0.0;
};

struct NetRates {
    int64_t rx_kb_per_sec = 0;
    int64_t tx_kb_per_sec = 0;
};

namespace delta {

constexpr uint64_t kSectorBytes = 512;

// (current - previous) / interval_seconds, truncated toward zero.
// Returns 0 on a counter reset (current < previous) or interval <= 0.
int64_t rate(int64_t current, int64_t previous, double interval_seconds);

// current - previous, or 0 on a counter reset
int64_t delta(int64_t current, int64_t previous);

double elapsed_seconds(SteadyClock::time_point from, SteadyClock::time_point to);

CpuBreakdown cpu_breakdown(const CpuCounters& prev, const CpuCounters& cur);
DiskRates disk_rates(const DiskCounters& prev, const DiskCounters& cur, double interval_seconds);
NetRates net_rates(const NetCounters& prev, const NetCounters& cur, double interval_seconds);

} // namespace delta
} // namespace nodestat
