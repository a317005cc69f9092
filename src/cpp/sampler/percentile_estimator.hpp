#pragma once
// =============================================================================
// PercentileEstimator -- latency percentiles from bucketed histograms
//
// The histogram carries per-bucket operation counts for one interval. The
// estimate for percentile P is the upper bound of the first bucket whose
// running count strictly exceeds floor(total * P / 100). Bounds are in
// microseconds; results are in milliseconds.
//
// Row layout is detected per row from its arity:
//   [bound, read]          read-only record (no writes recorded)
//   [bound, read, write]   read-and-write record
// =============================================================================

#include <cstdint>
#include <string>
#include <vector>
#include "../sources/metric_source.hpp"

namespace nodestat {

enum class OpKind { READ, WRITE };

inline const char* op_kind_str(OpKind k) {
    switch (k) {
        case OpKind::READ:  return "read";
        case OpKind::WRITE: return "write";
    }
    return "??";
}

struct LatencyPercentiles {
    double read_p99_ms = 0.0;
    double read_p95_ms = 0.0;
    double write_p99_ms = 0.0;
    double write_p95_ms = 0.0;
};

namespace percentile {

// target_percentile in [0, 100]. 0.0 when no operations were observed.
double estimate(const HistogramSnapshot& histogram, int target_percentile, OpKind kind);

// {read, write} x {99, 95}
LatencyPercentiles estimate_all(const HistogramSnapshot& histogram);

// "%.3f"; an empty interval (0) prints as "0.00"
std::string format_ms(double ms);

// Upper bounds (us) of the node's exponential latency buckets:
// 1, 2, 3, ... each step x1.2 rounded, advancing by at least 1.
std::vector<int64_t> bucket_offsets(size_t count);

} // namespace percentile
} // namespace nodestat
