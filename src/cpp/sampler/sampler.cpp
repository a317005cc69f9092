#include "sampler.hpp"
#include "delta_engine.hpp"
#include "percentile_estimator.hpp"
#include "../utils/logger.hpp"

#include <chrono>
#include <ctime>

namespace nodestat {

Sampler::Sampler(const SamplerConfig& config, MetricSource& source, HostSource& host,
                 IntervalPacer& pacer, SampleSink& sink)
    : config_(config)
    , source_(source)
    , host_(host)
    , pacer_(pacer)
    , sink_(sink)
{
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

Sampler::HostReading Sampler::read_host() {
    HostReading r;

    CpuCounters cpu;
    if (host_.read_cpu(cpu)) r.cpu = cpu;

    // The only disk sample of the cycle
    DiskCounters disk;
    if (host_.read_disk(config_.disk, disk)) r.disk = disk;

    NetCounters net;
    if (host_.read_net(config_.iface, net)) r.net = net;

    return r;
}

std::optional<ThreadPoolStats> Sampler::read_thread_pools() {
    if (!config_.show_cache && !config_.show_read_repair) return std::nullopt;

    ThreadPoolStats tp;
    if (!source_.read_thread_pools(tp)) {
        LOG_WRN("[sampler] %s: thread pool query returned no data", source_.source_name());
        return std::nullopt;
    }
    return tp;
}

void Sampler::stamp_wall_clock(std::optional<std::string>& timestamp,
                               std::optional<int64_t>& epoch) const {
    if (!config_.tag_timestamp && !config_.tag_epoch) return;

    std::time_t t = std::time(nullptr);
    if (config_.tag_epoch) epoch = static_cast<int64_t>(t);
    if (config_.tag_timestamp) {
        struct tm tm_buf{};
        localtime_r(&t, &tm_buf);
        char buf[16];
        std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm_buf);
        timestamp = buf;
    }
}

// ---------------------------------------------------------------------------
// Priming
// ---------------------------------------------------------------------------

void Sampler::prime() {
    previous_ = CounterSnapshot{};

    HostReading host = read_host();
    previous_.cpu = host.cpu;
    previous_.disk = host.disk;
    previous_.net = host.net;
    // Stamped where run_cycle() stamps, before the node queries
    previous_.taken_at = pacer_.now();

    TableCounters tc;
    if (source_.read_table_counters(config_.keyspace, config_.table, tc)) {
        previous_.valid = true;
        previous_.read_count = tc.read_count;
        previous_.write_count = tc.write_count;
    } else {
        LOG_WRN("[sampler] %s unresponsive while priming, first sample establishes the baseline",
            source_.source_name());
    }

    if (config_.show_read_repair) {
        if (auto tp = read_thread_pools()) {
            previous_.read_repair_completed = tp->read_repair_completed;
        }
    }

    // Consume whatever the log already holds; only new lines are classified
    if (!config_.log_file.empty()) {
        watermark_ = logscan::count_lines(config_.log_file);
        LOG_INF("[sampler] Watching %s from line %lld",
            config_.log_file.c_str(), static_cast<long long>(watermark_));
    }

    if (config_.show_percentiles) {
        // RecentValues resets on every read; drain the pre-start backlog
        HistogramSnapshot discard;
        if (!source_.read_histogram(config_.keyspace, config_.table, discard)) {
            LOG_DBG("[sampler] Histogram priming read returned no data");
        }
    }
}

// ---------------------------------------------------------------------------
// One cycle
// ---------------------------------------------------------------------------

CycleOutcome Sampler::run_cycle() {
    pacer_.wait_next();
    ++cycles_run_;

    Timer timer;
    timer.start();

    HostReading host = read_host();
    auto now = pacer_.now();

    TableCounters tc;
    if (!source_.read_table_counters(config_.keyspace, config_.table, tc)) {
        LOG_WRN("[sampler] %s returned no counters for %s%s%s, node unresponsive",
            source_.source_name(), config_.keyspace.c_str(),
            config_.table.empty() ? "" : ".", config_.table.c_str());
        std::optional<std::string> ts;
        std::optional<int64_t> epoch;
        stamp_wall_clock(ts, epoch);
        sink_.on_unresponsive(ts, epoch);
        return CycleOutcome::UNRESPONSIVE;
    }

    Sample s;
    stamp_wall_clock(s.timestamp, s.epoch);

    double elapsed = 0.0;
    if (previous_.valid) {
        elapsed = delta::elapsed_seconds(previous_.taken_at, now);
        s.reads_per_sec = delta::rate(tc.read_count, previous_.read_count, elapsed);
        s.writes_per_sec = delta::rate(tc.write_count, previous_.write_count, elapsed);
    }
    s.read_latency_ms = tc.read_latency_ms;
    s.write_latency_ms = tc.write_latency_ms;

    auto tp = read_thread_pools();
    if (config_.show_cache) {
        s.key_cache_hit_pct = tc.key_cache_hit_pct;
        s.row_cache_hit_pct = tc.row_cache_hit_pct;
        if (tp) s.read_stage_pending = tp->read_pending;
    }

    if (previous_.valid && elapsed > 0.0) {
        if (previous_.cpu && host.cpu) s.cpu = delta::cpu_breakdown(*previous_.cpu, *host.cpu);
        if (previous_.disk && host.disk) s.disk = delta::disk_rates(*previous_.disk, *host.disk, elapsed);
        if (previous_.net && host.net) s.net = delta::net_rates(*previous_.net, *host.net, elapsed);
    }

    std::optional<int64_t> read_repair_completed;
    if (config_.show_read_repair && tp) {
        read_repair_completed = tp->read_repair_completed;
        s.read_repairs = previous_.read_repair_completed
            ? delta::delta(tp->read_repair_completed, *previous_.read_repair_completed)
            : 0;
    }

    if (config_.show_percentiles) {
        HistogramSnapshot hist;
        if (source_.read_histogram(config_.keyspace, config_.table, hist)) {
            s.percentiles = percentile::estimate_all(hist);
        } else {
            LOG_WRN("[sampler] %s: histogram query for %s.%s returned no data",
                source_.source_name(), config_.keyspace.c_str(), config_.table.c_str());
        }
    }

    if (config_.show_compaction) {
        CompactionStats cs;
        if (source_.read_compactions(cs)) {
            s.compaction = CompactionSummary{cs.pending, cs.active};
        } else {
            LOG_WRN("[sampler] %s: compaction query returned no data", source_.source_name());
        }
    }

    std::vector<LogEvent> events;
    if (!config_.log_file.empty()) {
        auto scan = logscan::extract_events(config_.log_file, watermark_);
        events = std::move(scan.events);
        watermark_ = scan.watermark;
    }

    if (!previous_.valid) {
        LOG_INF("[sampler] Baseline established, rates start next cycle");
    }

    // New baseline (a reset counter becomes the baseline as-is)
    previous_.valid = true;
    previous_.taken_at = now;
    previous_.read_count = tc.read_count;
    previous_.write_count = tc.write_count;
    previous_.cpu = host.cpu;
    previous_.disk = host.disk;
    previous_.net = host.net;
    // A failed thread pool query keeps the older read-repair baseline
    if (read_repair_completed) previous_.read_repair_completed = read_repair_completed;

    timer.stop();
    LOG_DBG("[sampler] Cycle %lld collected in %lld ms (elapsed %.3f s, %zu events)",
        static_cast<long long>(cycles_run_), static_cast<long long>(timer.elapsed_ms()),
        elapsed, events.size());

    sink_.on_sample(s, events);
    ++samples_emitted_;
    return CycleOutcome::RESPONSIVE;
}

// ---------------------------------------------------------------------------
// Loop
// ---------------------------------------------------------------------------

int64_t Sampler::run() {
    LOG_INF("[sampler] Sampling %s%s%s every %d s (%s)",
        config_.keyspace.c_str(), config_.table.empty() ? "" : ".", config_.table.c_str(),
        config_.interval_s,
        config_.sample_count > 0
            ? (std::to_string(config_.sample_count) + " cycles").c_str()
            : "unbounded");

    prime();

    while (config_.sample_count <= 0 || cycles_run_ < config_.sample_count) {
        run_cycle();
    }

    LOG_INF("[sampler] Done (cycles=%lld, samples=%lld)",
        static_cast<long long>(cycles_run_), static_cast<long long>(samples_emitted_));
    return samples_emitted_;
}

} // namespace nodestat
