#pragma once
// One emitted record per responsive sampling cycle. Immutable once handed
// to a sink.
//
// NOTE: reads_per_sec / writes_per_sec are per-interval rates, while
// read_latency_ms / write_latency_ms are the node's LIFETIME mean latency
// as observed at sample time. The percentile columns, by contrast, cover
// only the last interval.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "delta_engine.hpp"
#include "percentile_estimator.hpp"
#include "../sources/metric_source.hpp"

namespace nodestat {

struct CompactionSummary {
    int64_t pending = 0;
    std::vector<CompactionTask> active;

    // "pending:N type:P% ..."
    std::string to_string() const;
};

struct Sample {
    std::optional<std::string> timestamp;   // local HH:MM:SS
    std::optional<int64_t> epoch;           // unix seconds

    int64_t reads_per_sec = 0;
    int64_t writes_per_sec = 0;
    double read_latency_ms = 0.0;
    double write_latency_ms = 0.0;

    std::optional<double> key_cache_hit_pct;
    std::optional<double> row_cache_hit_pct;
    std::optional<int64_t> read_stage_pending;

    CpuBreakdown cpu;
    DiskRates disk;
    NetRates net;

    std::optional<int64_t> read_repairs;
    std::optional<LatencyPercentiles> percentiles;
    std::optional<CompactionSummary> compaction;

    nlohmann::json to_json() const;
};

} // namespace nodestat
