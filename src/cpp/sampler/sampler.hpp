// =============================================================================
// Sampler -- the fixed-interval sampling loop
//
//   prime()      baseline counters + log watermark, nothing emitted
//   run_cycle()  wait for the interval, take one host sample, query the
//                node; on an empty primary query report the node as
//                unresponsive and keep the old baseline, otherwise compute
//                rates / percentiles / events and emit one Sample
//   run()        prime, then run_cycle() until sample_count cycles ran
//
// Single-threaded: the baseline and the watermark are owned by the Sampler
// and only touched from the calling thread.
//
// Rates are divided by the time elapsed since the stored baseline was
// taken, so a cycle following an unresponsive one covers the whole gap.
// =============================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../config.hpp"
#include "../sources/host_source.hpp"
#include "../sources/metric_source.hpp"
#include "../utils/timer.hpp"
#include "log_classifier.hpp"
#include "sample.hpp"

namespace nodestat {

enum class CycleOutcome { RESPONSIVE, UNRESPONSIVE };

inline const char* cycle_outcome_str(CycleOutcome o) {
    switch (o) {
        case CycleOutcome::RESPONSIVE:   return "responsive";
        case CycleOutcome::UNRESPONSIVE: return "unresponsive";
    }
    return "??";
}

// Receives the loop's output (the presentation layer)
class SampleSink {
public:
    virtual ~SampleSink() = default;

    virtual void on_sample(const Sample& sample, const std::vector<LogEvent>& events) = 0;

    virtual void on_unresponsive(const std::optional<std::string>& timestamp,
                                 std::optional<int64_t> epoch) = 0;
};

// Counters from the last successful cycle
struct CounterSnapshot {
    bool valid = false;
    SteadyClock::time_point taken_at{};

    int64_t read_count = 0;
    int64_t write_count = 0;
    std::optional<int64_t> read_repair_completed;

    std::optional<CpuCounters> cpu;
    std::optional<DiskCounters> disk;
    std::optional<NetCounters> net;
};

class Sampler {
public:
    Sampler(const SamplerConfig& config, MetricSource& source, HostSource& host,
            IntervalPacer& pacer, SampleSink& sink);

    void prime();
    CycleOutcome run_cycle();

    // Returns the number of Samples emitted
    int64_t run();

    const CounterSnapshot& previous() const { return previous_; }
    int64_t watermark() const { return watermark_; }
    int64_t samples_emitted() const { return samples_emitted_; }
    int64_t cycles_run() const { return cycles_run_; }

private:
    struct HostReading {
        std::optional<CpuCounters> cpu;
        std::optional<DiskCounters> disk;
        std::optional<NetCounters> net;
    };

    HostReading read_host();
    std::optional<ThreadPoolStats> read_thread_pools();
    void stamp_wall_clock(std::optional<std::string>& timestamp,
                          std::optional<int64_t>& epoch) const;

    SamplerConfig config_;
    MetricSource& source_;
    HostSource& host_;
    IntervalPacer& pacer_;
    SampleSink& sink_;

    CounterSnapshot previous_;
    int64_t watermark_ = 0;

    int64_t samples_emitted_ = 0;
    int64_t cycles_run_ = 0;
};

} // namespace nodestat
