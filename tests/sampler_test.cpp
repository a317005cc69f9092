#include <gtest/gtest.h>

#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <unistd.h>

#include "sampler/sampler.hpp"

namespace fs = std::filesystem;

namespace nodestat {
namespace {

// --- fakes ------------------------------------------------------------------

class FakeSource : public MetricSource {
public:
    std::deque<std::optional<TableCounters>> counters;   // one per query, nullopt = no data
    std::deque<std::optional<ThreadPoolStats>> pools;      // nullopt = no data
    std::deque<HistogramSnapshot> histograms;
    std::function<void()> on_histogram;
    std::optional<CompactionStats> compactions;

    int counter_queries = 0;
    int pool_queries = 0;
    int histogram_queries = 0;

    void respond(int64_t reads, int64_t writes) {
        TableCounters tc;
        tc.read_count = reads;
        tc.write_count = writes;
        tc.read_latency_ms = 0.5;
        tc.write_latency_ms = 0.25;
        tc.key_cache_hit_pct = 90.0;
        counters.push_back(tc);
    }

    void go_silent() { counters.push_back(std::nullopt); }

    bool read_table_counters(const std::string&, const std::string&, TableCounters& out) override {
        ++counter_queries;
        if (counters.empty()) return false;
        auto next = counters.front();
        counters.pop_front();
        if (!next) return false;
        out = *next;
        return true;
    }

    bool read_thread_pools(ThreadPoolStats& out) override {
        ++pool_queries;
        if (pools.empty()) return false;
        auto next = pools.front();
        pools.pop_front();
        if (!next) return false;
        out = *next;
        return true;
    }

    bool read_histogram(const std::string&, const std::string&, HistogramSnapshot& out) override {
        ++histogram_queries;
        if (on_histogram) on_histogram();
        if (histograms.empty()) return false;
        out = histograms.front();
        histograms.pop_front();
        return true;
    }

    bool read_compactions(CompactionStats& out) override {
        if (!compactions) return false;
        out = *compactions;
        return true;
    }

    const char* source_name() const override { return "fake"; }
};

// Host whose counters grow by a fixed step on every read
class FakeHost : public HostSource {
public:
    int cpu_reads = 0;
    int disk_reads = 0;
    int net_reads = 0;
    bool fail = false;

    bool read_cpu(CpuCounters& out) override {
        ++cpu_reads;
        if (fail) return false;
        out.user = 60 * cpu_reads;
        out.idle = 40 * cpu_reads;
        return true;
    }

    bool read_disk(const std::string&, DiskCounters& out) override {
        ++disk_reads;
        if (fail) return false;
        out.reads_completed = 100 * disk_reads;
        out.sectors_read = 10240 * disk_reads;
        out.io_ticks_ms = 1000 * disk_reads;
        return true;
    }

    bool read_net(const std::string&, NetCounters& out) override {
        ++net_reads;
        if (fail) return false;
        out.rx_bytes = 51200 * net_reads;
        return true;
    }
};

// Virtual clock: every wait advances time by exactly one interval
class FakePacer : public IntervalPacer {
public:
    explicit FakePacer(std::chrono::seconds interval) : interval_(interval) {}

    std::function<void()> on_wait;

    void wait_next() override {
        now_ += interval_;
        if (on_wait) on_wait();
    }

    SteadyClock::time_point now() const override { return now_; }

    void skip(std::chrono::seconds extra) { now_ += extra; }

private:
    std::chrono::seconds interval_;
    SteadyClock::time_point now_{};
};

class RecordingSink : public SampleSink {
public:
    std::vector<Sample> samples;
    std::vector<LogEvent> events;
    int unresponsive = 0;
    std::vector<std::string> order;

    void on_sample(const Sample& s, const std::vector<LogEvent>& ev) override {
        samples.push_back(s);
        events.insert(events.end(), ev.begin(), ev.end());
        order.push_back("sample");
    }

    void on_unresponsive(const std::optional<std::string>&, std::optional<int64_t>) override {
        ++unresponsive;
        order.push_back("unresponsive");
    }
};

class SamplerTest : public ::testing::Test {
protected:
    SamplerTest() : pacer_(std::chrono::seconds(5)) {
        config_.keyspace = "ks";
        config_.table = "users";
        config_.interval_s = 5;
    }

    Sampler make() { return Sampler(config_, source_, host_, pacer_, sink_); }

    SamplerConfig config_;
    FakeSource source_;
    FakeHost host_;
    FakePacer pacer_;
    RecordingSink sink_;
};

// --- tests ------------------------------------------------------------------

TEST_F(SamplerTest, FixedCountEmitsExactlyThatManySamples) {
    config_.sample_count = 3;
    for (int i = 0; i < 4; ++i) source_.respond(100 * i, 50 * i);

    Sampler sampler = make();
    EXPECT_EQ(sampler.run(), 3);
    EXPECT_EQ(sampler.cycles_run(), 3);
    ASSERT_EQ(sink_.samples.size(), 3u);
    for (const auto& s : sink_.samples) {
        EXPECT_EQ(s.reads_per_sec, 20);
        EXPECT_EQ(s.writes_per_sec, 10);
    }
}

TEST_F(SamplerTest, LatenciesAreCopiedAsIs) {
    source_.respond(0, 0);
    source_.respond(10, 10);
    Sampler sampler = make();
    sampler.prime();
    ASSERT_EQ(sampler.run_cycle(), CycleOutcome::RESPONSIVE);
    EXPECT_DOUBLE_EQ(sink_.samples[0].read_latency_ms, 0.5);
    EXPECT_DOUBLE_EQ(sink_.samples[0].write_latency_ms, 0.25);
}

TEST_F(SamplerTest, SlowPrimingDoesNotInflateFirstRates) {
    config_.show_percentiles = true;
    source_.respond(0, 0);
    source_.respond(800, 0);

    // the priming histogram drain takes 3 s of the first interval
    source_.on_histogram = [this]() {
        if (source_.histogram_queries == 1) pacer_.skip(std::chrono::seconds(3));
    };

    Sampler sampler = make();
    sampler.prime();
    sampler.run_cycle();

    // 800 reads over the 8 s between the two counter reads
    ASSERT_EQ(sink_.samples.size(), 1u);
    EXPECT_EQ(sink_.samples[0].reads_per_sec, 100);
}

TEST_F(SamplerTest, UnresponsiveCycleKeepsBaseline) {
    source_.respond(0, 0);
    source_.respond(100, 0);
    source_.go_silent();
    source_.respond(300, 0);

    Sampler sampler = make();
    sampler.prime();
    EXPECT_EQ(sampler.run_cycle(), CycleOutcome::RESPONSIVE);
    EXPECT_EQ(sink_.samples.back().reads_per_sec, 20);

    auto before = sampler.previous();
    EXPECT_EQ(sampler.run_cycle(), CycleOutcome::UNRESPONSIVE);
    EXPECT_EQ(sink_.unresponsive, 1);
    EXPECT_EQ(sink_.samples.size(), 1u);
    EXPECT_EQ(sampler.previous().read_count, before.read_count);
    EXPECT_EQ(sampler.previous().taken_at, before.taken_at);

    // 200 reads over the 10 s since the last baseline
    EXPECT_EQ(sampler.run_cycle(), CycleOutcome::RESPONSIVE);
    EXPECT_EQ(sink_.samples.back().reads_per_sec, 20);
    EXPECT_EQ(sink_.order, (std::vector<std::string>{"sample", "unresponsive", "sample"}));
}

TEST_F(SamplerTest, UnresponsiveCyclesCountTowardTheBudget) {
    config_.sample_count = 3;
    source_.respond(0, 0);
    source_.respond(10, 0);
    source_.go_silent();
    source_.respond(20, 0);

    Sampler sampler = make();
    EXPECT_EQ(sampler.run(), 2);
    EXPECT_EQ(sampler.cycles_run(), 3);
    EXPECT_EQ(sink_.unresponsive, 1);
}

TEST_F(SamplerTest, CounterResetReportsZeroThenResumes) {
    source_.respond(1000, 1000);
    source_.respond(5, 5);
    source_.respond(25, 55);

    Sampler sampler = make();
    sampler.prime();
    sampler.run_cycle();
    EXPECT_EQ(sink_.samples[0].reads_per_sec, 0);
    EXPECT_EQ(sink_.samples[0].writes_per_sec, 0);
    EXPECT_EQ(sampler.previous().read_count, 5);

    sampler.run_cycle();
    EXPECT_EQ(sink_.samples[1].reads_per_sec, 4);
    EXPECT_EQ(sink_.samples[1].writes_per_sec, 10);
}

TEST_F(SamplerTest, UnresponsivePrimeFirstSampleEstablishesBaseline) {
    source_.go_silent();
    source_.respond(500, 500);
    source_.respond(600, 500);

    Sampler sampler = make();
    sampler.prime();
    EXPECT_FALSE(sampler.previous().valid);

    sampler.run_cycle();
    EXPECT_EQ(sink_.samples[0].reads_per_sec, 0);
    EXPECT_DOUBLE_EQ(sink_.samples[0].cpu.user_pct, 0.0);
    EXPECT_TRUE(sampler.previous().valid);

    sampler.run_cycle();
    EXPECT_EQ(sink_.samples[1].reads_per_sec, 20);
}

TEST_F(SamplerTest, SilentNodeNeverEmits) {
    config_.sample_count = 4;
    Sampler sampler = make();
    EXPECT_EQ(sampler.run(), 0);
    EXPECT_EQ(sink_.unresponsive, 4);
    EXPECT_TRUE(sink_.samples.empty());
}

TEST_F(SamplerTest, OneDiskSamplePerCycle) {
    config_.sample_count = 4;
    for (int i = 0; i < 5; ++i) source_.respond(i, i);

    Sampler sampler = make();
    sampler.run();
    EXPECT_EQ(host_.disk_reads, 5);     // prime + 4 cycles
    EXPECT_EQ(host_.cpu_reads, 5);
    EXPECT_EQ(host_.net_reads, 5);
}

TEST_F(SamplerTest, HostRatesFromConsecutiveReadings) {
    source_.respond(0, 0);
    source_.respond(0, 0);

    Sampler sampler = make();
    sampler.prime();
    sampler.run_cycle();

    const Sample& s = sink_.samples[0];
    EXPECT_DOUBLE_EQ(s.cpu.user_pct, 60.0);
    EXPECT_DOUBLE_EQ(s.cpu.idle_pct, 40.0);
    EXPECT_EQ(s.disk.reads_per_sec, 20);
    EXPECT_EQ(s.disk.read_kb_per_sec, 1024);    // 10240 sectors * 512 B / 5 s
    EXPECT_DOUBLE_EQ(s.disk.util_pct, 20.0);
    EXPECT_EQ(s.net.rx_kb_per_sec, 10);
}

TEST_F(SamplerTest, HostReadFailureLeavesZeroRates) {
    source_.respond(0, 0);
    source_.respond(100, 0);
    host_.fail = true;

    Sampler sampler = make();
    sampler.prime();
    EXPECT_EQ(sampler.run_cycle(), CycleOutcome::RESPONSIVE);
    EXPECT_EQ(sink_.samples[0].reads_per_sec, 20);
    EXPECT_EQ(sink_.samples[0].disk.reads_per_sec, 0);
    EXPECT_DOUBLE_EQ(sink_.samples[0].cpu.idle_pct, 0.0);
}

TEST_F(SamplerTest, OptionalColumnsStayEmptyWhenDisabled) {
    source_.respond(0, 0);
    source_.respond(10, 10);

    Sampler sampler = make();
    sampler.prime();
    sampler.run_cycle();

    const Sample& s = sink_.samples[0];
    EXPECT_FALSE(s.key_cache_hit_pct.has_value());
    EXPECT_FALSE(s.read_repairs.has_value());
    EXPECT_FALSE(s.percentiles.has_value());
    EXPECT_FALSE(s.compaction.has_value());
    EXPECT_FALSE(s.epoch.has_value());
    EXPECT_FALSE(s.timestamp.has_value());
    EXPECT_EQ(source_.pool_queries, 0);
    EXPECT_EQ(source_.histogram_queries, 0);
}

TEST_F(SamplerTest, CacheColumnsAndReadStageBacklog) {
    config_.show_cache = true;
    source_.respond(0, 0);
    source_.respond(10, 10);
    ThreadPoolStats tp;
    tp.read_pending = 12;
    source_.pools.push_back(tp);

    Sampler sampler = make();
    sampler.prime();
    sampler.run_cycle();

    const Sample& s = sink_.samples[0];
    ASSERT_TRUE(s.key_cache_hit_pct.has_value());
    EXPECT_DOUBLE_EQ(*s.key_cache_hit_pct, 90.0);
    EXPECT_FALSE(s.row_cache_hit_pct.has_value());
    ASSERT_TRUE(s.read_stage_pending.has_value());
    EXPECT_EQ(*s.read_stage_pending, 12);
}

TEST_F(SamplerTest, ReadRepairsAreCountedPerInterval) {
    config_.show_read_repair = true;
    for (int i = 0; i < 3; ++i) source_.respond(i, i);
    for (int64_t completed : {10, 15, 15}) {
        ThreadPoolStats tp;
        tp.read_repair_completed = completed;
        source_.pools.push_back(tp);
    }

    Sampler sampler = make();
    sampler.prime();
    sampler.run_cycle();
    sampler.run_cycle();

    ASSERT_TRUE(sink_.samples[0].read_repairs.has_value());
    EXPECT_EQ(*sink_.samples[0].read_repairs, 5);
    EXPECT_EQ(*sink_.samples[1].read_repairs, 0);
}

TEST_F(SamplerTest, FailedThreadPoolQueryKeepsReadRepairBaseline) {
    config_.show_read_repair = true;
    for (int i = 0; i < 3; ++i) source_.respond(i, i);
    ThreadPoolStats start;
    start.read_repair_completed = 10;
    ThreadPoolStats later;
    later.read_repair_completed = 18;
    source_.pools.push_back(start);
    source_.pools.push_back(std::nullopt);
    source_.pools.push_back(later);

    Sampler sampler = make();
    sampler.prime();
    sampler.run_cycle();
    EXPECT_FALSE(sink_.samples[0].read_repairs.has_value());
    ASSERT_TRUE(sampler.previous().read_repair_completed.has_value());
    EXPECT_EQ(*sampler.previous().read_repair_completed, 10);

    // repairs from the missed interval are still counted
    sampler.run_cycle();
    ASSERT_TRUE(sink_.samples[1].read_repairs.has_value());
    EXPECT_EQ(*sink_.samples[1].read_repairs, 8);
}

TEST_F(SamplerTest, PercentilesComeFromTheIntervalHistogram) {
    config_.show_percentiles = true;
    source_.respond(0, 0);
    source_.respond(10, 10);
    source_.respond(20, 20);

    HistogramSnapshot backlog;
    backlog.rows = {{10, 1000, 0}};
    HistogramSnapshot interval;
    interval.rows = {{10, 1, 0}, {20, 2, 0}, {30, 7, 0}};
    source_.histograms.push_back(backlog);
    source_.histograms.push_back(interval);

    Sampler sampler = make();
    sampler.prime();
    EXPECT_EQ(source_.histogram_queries, 1);
    sampler.run_cycle();

    ASSERT_TRUE(sink_.samples[0].percentiles.has_value());
    EXPECT_DOUBLE_EQ(sink_.samples[0].percentiles->read_p99_ms, 0.030);
    EXPECT_DOUBLE_EQ(sink_.samples[0].percentiles->write_p99_ms, 0.0);

    // histogram query failed: no percentile values for that sample
    sampler.run_cycle();
    EXPECT_FALSE(sink_.samples[1].percentiles.has_value());
}

TEST_F(SamplerTest, CompactionSummary) {
    config_.show_compaction = true;
    source_.respond(0, 0);
    source_.respond(0, 0);
    CompactionStats cs;
    cs.pending = 2;
    cs.active.push_back({"Compaction", 40.0});
    source_.compactions = cs;

    Sampler sampler = make();
    sampler.prime();
    sampler.run_cycle();

    ASSERT_TRUE(sink_.samples[0].compaction.has_value());
    EXPECT_EQ(sink_.samples[0].compaction->to_string(), "pending:2 Compaction:40%");
}

TEST_F(SamplerTest, EpochTagging) {
    config_.tag_epoch = true;
    config_.tag_timestamp = true;
    source_.respond(0, 0);
    source_.respond(0, 0);

    Sampler sampler = make();
    sampler.prime();
    sampler.run_cycle();

    ASSERT_TRUE(sink_.samples[0].epoch.has_value());
    EXPECT_GT(*sink_.samples[0].epoch, 0);
    ASSERT_TRUE(sink_.samples[0].timestamp.has_value());
    EXPECT_EQ(sink_.samples[0].timestamp->size(), 8u);
}

TEST_F(SamplerTest, OnlyLinesAppendedAfterStartAreClassified) {
    fs::path log = fs::temp_directory_path() /
        ("nodestat_sampler_" + std::to_string(::getpid()) + ".log");
    {
        std::ofstream out(log, std::ios::trunc);
        out << " INFO [x] 2024-05-01 09:00:00 A.java (line 1) flush completed\n";
        out << " INFO [x] 2024-05-01 09:00:01 A.java (line 1) flush completed\n";
    }
    config_.log_file = log.string();
    for (int i = 0; i < 3; ++i) source_.respond(i, i);

    int waits = 0;
    pacer_.on_wait = [&]() {
        if (++waits == 1) {
            std::ofstream out(log, std::ios::app);
            out << " INFO [x] 2024-05-01 09:00:05 A.java (line 1) repair started, repairing 3 ranges\n";
            out << " INFO [x] 2024-05-01 09:00:06 A.java (line 1) nothing interesting\n";
        }
    };

    Sampler sampler = make();
    sampler.prime();
    EXPECT_EQ(sampler.watermark(), 2);

    sampler.run_cycle();
    ASSERT_EQ(sink_.events.size(), 1u);
    EXPECT_EQ(sink_.events[0].tag, EventTag::REPAIR_STARTED);
    EXPECT_EQ(sink_.events[0].timestamp, "09:00:05");
    EXPECT_EQ(sink_.events[0].fields, (std::vector<std::string>{"3"}));
    EXPECT_EQ(sampler.watermark(), 4);

    sampler.run_cycle();
    EXPECT_EQ(sink_.events.size(), 1u);
    EXPECT_EQ(sampler.watermark(), 4);

    fs::remove(log);
}

} // namespace
} // namespace nodestat
