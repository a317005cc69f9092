#pragma once
// Abstract interface for the database node's metric registry.
// Every query is blocking and returns false when the node gave no data;
// the sampler treats a false primary query as an unresponsive node.
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nodestat {

// Keyspace- or table-scoped operation counters.
// Latencies are the node's lifetime mean, not a per-interval figure.
struct TableCounters {
    int64_t read_count = 0;
    int64_t write_count = 0;
    double read_latency_ms = 0.0;
    double write_latency_ms = 0.0;
    std::optional<double> key_cache_hit_pct;
    std::optional<double> row_cache_hit_pct;
};

struct ThreadPoolStats {
    int64_t read_active = 0;
    int64_t read_pending = 0;
    int64_t read_repair_active = 0;
    int64_t read_repair_pending = 0;
    int64_t read_repair_completed = 0;     // cumulative
};

// Per-bucket latency counts for one sampling interval, ascending by bound.
// Each row is [upper_bound_us, read] or [upper_bound_us, read, write].
struct HistogramSnapshot {
    std::vector<std::vector<int64_t>> rows;
};

struct CompactionTask {
    std::string type;
    double percent_complete = 0.0;
};

struct CompactionStats {
    int64_t pending = 0;
    std::vector<CompactionTask> active;
};

class MetricSource {
public:
    virtual ~MetricSource() = default;

    // Empty table: keyspace-wide counters
    virtual bool read_table_counters(const std::string& keyspace,
                                     const std::string& table,
                                     TableCounters& out) = 0;

    virtual bool read_thread_pools(ThreadPoolStats& out) = 0;

    virtual bool read_histogram(const std::string& keyspace,
                                const std::string& table,
                                HistogramSnapshot& out) = 0;

    virtual bool read_compactions(CompactionStats& out) = 0;

    [[nodiscard]] virtual const char* source_name() const = 0;
};

} // namespace nodestat
