#include "percentile_estimator.hpp"
#include "../utils/logger.hpp"

#include <cmath>
#include <cstdio>

namespace nodestat {
namespace percentile {

// Count column for an op kind, or -1 if the row does not carry it
static int column_for(size_t arity, OpKind kind) {
    if (arity == 2) return kind == OpKind::READ ? 1 : -1;
    if (arity == 3) return kind == OpKind::READ ? 1 : 2;
    return -1;
}

double estimate(const HistogramSnapshot& histogram, int target_percentile, OpKind kind) {
    int64_t total = 0;
    for (const auto& row : histogram.rows) {
        int col = column_for(row.size(), kind);
        if (col < 0) continue;
        total += row[col];
    }
    if (total == 0) return 0.0;

    int64_t threshold = total * target_percentile / 100;

    int64_t running = 0;
    for (const auto& row : histogram.rows) {
        int col = column_for(row.size(), kind);
        if (col < 0) continue;
        running += row[col];
        if (running > threshold) {
            return static_cast<double>(row[0]) / 1000.0;
        }
    }

    LOG_DBG("[percentile] p%d %s: no bucket exceeded threshold %lld of %lld",
        target_percentile, op_kind_str(kind),
        static_cast<long long>(threshold), static_cast<long long>(total));
    return 0.0;
}

LatencyPercentiles estimate_all(const HistogramSnapshot& histogram) {
    LatencyPercentiles p;
    p.read_p99_ms  = estimate(histogram, 99, OpKind::READ);
    p.read_p95_ms  = estimate(histogram, 95, OpKind::READ);
    p.write_p99_ms = estimate(histogram, 99, OpKind::WRITE);
    p.write_p95_ms = estimate(histogram, 95, OpKind::WRITE);
    return p;
}

std::string format_ms(double ms) {
    if (ms == 0.0) return "0.00";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", ms);
    return buf;
}

std::vector<int64_t> bucket_offsets(size_t count) {
    std::vector<int64_t> offsets;
    offsets.reserve(count);
    if (count == 0) return offsets;

    int64_t last = 1;
    offsets.push_back(last);
    while (offsets.size() < count) {
        auto next = static_cast<int64_t>(std::llround(static_cast<double>(last) * 1.2));
        if (next == last) next++;
        offsets.push_back(next);
        last = next;
    }
    return offsets;
}

} // namespace percentile
} // namespace nodestat
