#include <gtest/gtest.h>

#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

#include "output/row_writer.hpp"

namespace nodestat {
namespace {

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

int count_prefix(const std::vector<std::string>& lines, const std::string& needle) {
    int n = 0;
    for (const auto& l : lines) {
        if (l.find(needle) != std::string::npos) ++n;
    }
    return n;
}

Sample basic_sample() {
    Sample s;
    s.reads_per_sec = 1234;
    s.writes_per_sec = 56;
    s.read_latency_ms = 0.85;
    s.write_latency_ms = 0.12;
    return s;
}

TEST(RowWriterTest, HeaderRepeatsEveryTenRows) {
    SamplerConfig cfg;
    std::ostringstream rows;
    RowWriter w(cfg, rows, rows);

    for (int i = 0; i < 21; ++i) w.on_sample(basic_sample(), {});

    auto lines = lines_of(rows.str());
    EXPECT_EQ(lines.size(), 24u);
    EXPECT_EQ(count_prefix(lines, "reads/s"), 3);
    EXPECT_NE(lines[0].find("reads/s"), std::string::npos);
    EXPECT_NE(lines[11].find("reads/s"), std::string::npos);
    EXPECT_NE(lines[22].find("reads/s"), std::string::npos);
    EXPECT_EQ(w.rows_written(), 21);
}

TEST(RowWriterTest, HeaderCanBeDisabled) {
    SamplerConfig cfg;
    cfg.header = false;
    std::ostringstream rows;
    RowWriter w(cfg, rows, rows);

    for (int i = 0; i < 12; ++i) w.on_sample(basic_sample(), {});
    auto lines = lines_of(rows.str());
    EXPECT_EQ(lines.size(), 12u);
    EXPECT_EQ(count_prefix(lines, "reads/s"), 0);
}

TEST(RowWriterTest, RowCarriesRatesAndLatencies) {
    SamplerConfig cfg;
    RowWriter w(cfg, std::cout, std::cout);
    std::string row = w.format_row(basic_sample());
    EXPECT_NE(row.find("1234"), std::string::npos);
    EXPECT_NE(row.find("56"), std::string::npos);
    EXPECT_NE(row.find("0.850"), std::string::npos);
    EXPECT_NE(row.find("0.120"), std::string::npos);
}

TEST(RowWriterTest, OptionalColumnsFollowConfiguration) {
    SamplerConfig cfg;
    RowWriter plain(cfg, std::cout, std::cout);
    std::string h = plain.header_line();
    EXPECT_EQ(h.find("kc%"), std::string::npos);
    EXPECT_EQ(h.find("rrep"), std::string::npos);
    EXPECT_EQ(h.find("r99_ms"), std::string::npos);
    EXPECT_EQ(h.find("epoch"), std::string::npos);

    cfg.show_cache = true;
    cfg.show_read_repair = true;
    cfg.show_percentiles = true;
    cfg.show_compaction = true;
    cfg.tag_epoch = true;
    RowWriter full(cfg, std::cout, std::cout);
    h = full.header_line();
    EXPECT_NE(h.find("kc%"), std::string::npos);
    EXPECT_NE(h.find("rrep"), std::string::npos);
    EXPECT_NE(h.find("r99_ms"), std::string::npos);
    EXPECT_NE(h.find("w95_ms"), std::string::npos);
    EXPECT_NE(h.find("compaction"), std::string::npos);
    EXPECT_EQ(h.find("epoch"), h.find_first_not_of(" "));

    Sample s = basic_sample();
    s.epoch = 1714550400;
    s.key_cache_hit_pct = 97.5;
    s.read_repairs = 3;
    s.percentiles = LatencyPercentiles{0.03, 0.02, 1.5, 1.0};
    s.compaction = CompactionSummary{4, {{"Compaction", 12.0}}};
    std::string row = full.format_row(s);
    EXPECT_NE(row.find("1714550400"), std::string::npos);
    EXPECT_NE(row.find("97.5"), std::string::npos);
    EXPECT_NE(row.find("0.030"), std::string::npos);
    EXPECT_NE(row.find("1.500"), std::string::npos);
    EXPECT_NE(row.find("pending:4 Compaction:12%"), std::string::npos);

    // missing optional values render as "-"
    Sample bare = basic_sample();
    std::string dashed = full.format_row(bare);
    EXPECT_NE(dashed.find(" -"), std::string::npos);
    EXPECT_EQ(dashed.find("pending:"), std::string::npos);
}

TEST(RowWriterTest, IdleIntervalPercentilesPrintAsZero) {
    SamplerConfig cfg;
    cfg.show_percentiles = true;
    RowWriter w(cfg, std::cout, std::cout);

    Sample s = basic_sample();
    s.percentiles = LatencyPercentiles{};
    std::string row = w.format_row(s);
    EXPECT_NE(row.find("    0.00     0.00     0.00     0.00"), std::string::npos);
}

TEST(RowWriterTest, UnresponsiveSentinelCountsAsRow) {
    SamplerConfig cfg;
    std::ostringstream rows;
    RowWriter w(cfg, rows, rows);

    w.on_sample(basic_sample(), {});
    w.on_unresponsive(std::nullopt, std::nullopt);
    w.on_sample(basic_sample(), {});

    auto lines = lines_of(rows.str());
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[2], "-- node unresponsive --");
    EXPECT_EQ(w.rows_written(), 3);
}

TEST(RowWriterTest, UnresponsiveSentinelKeepsTimeTags) {
    SamplerConfig cfg;
    cfg.tag_timestamp = true;
    cfg.header = false;
    std::ostringstream rows;
    RowWriter w(cfg, rows, rows);

    w.on_unresponsive(std::string("12:34:56"), std::nullopt);
    EXPECT_EQ(rows.str(), "12:34:56 -- node unresponsive --\n");
}

TEST(RowWriterTest, EventsGoToTheirOwnStream) {
    SamplerConfig cfg;
    std::ostringstream rows;
    std::ostringstream events;
    RowWriter w(cfg, rows, events);

    std::vector<LogEvent> evs = {
        {"12:00:00", EventTag::TREE_SENT, {"peer", "/10.0.0.2", "dc1"}},
        {"12:00:01", EventTag::FLUSH_COMPLETED, {}},
    };
    w.on_sample(basic_sample(), evs);

    EXPECT_EQ(lines_of(rows.str()).size(), 2u);
    auto ev_lines = lines_of(events.str());
    ASSERT_EQ(ev_lines.size(), 2u);
    EXPECT_EQ(ev_lines[0], "[event] 12:00:00 TreeSent peer /10.0.0.2 dc1");
    EXPECT_EQ(ev_lines[1], "[event] 12:00:01 FlushCompleted");
}

TEST(RowWriterTest, JsonLinesMode) {
    SamplerConfig cfg;
    cfg.format = OutputFormat::JSON;
    std::ostringstream rows;
    RowWriter w(cfg, rows, rows);

    Sample s = basic_sample();
    s.read_repairs = 2;
    w.on_sample(s, {{"12:00:00", EventTag::REPAIR_STARTED, {"256"}}});
    w.on_unresponsive(std::nullopt, int64_t{1714550400});

    auto lines = lines_of(rows.str());
    ASSERT_EQ(lines.size(), 3u);

    auto row = nlohmann::json::parse(lines[0]);
    EXPECT_EQ(row["reads_per_sec"], 1234);
    EXPECT_EQ(row["read_repairs"], 2);
    EXPECT_FALSE(row.contains("percentiles_ms"));
    EXPECT_FALSE(row.contains("key_cache_hit_pct"));

    auto ev = nlohmann::json::parse(lines[1]);
    EXPECT_EQ(ev["event"], "RepairStarted");
    EXPECT_EQ(ev["fields"][0], "256");

    auto down = nlohmann::json::parse(lines[2]);
    EXPECT_EQ(down["unresponsive"], true);
    EXPECT_EQ(down["epoch"], 1714550400);
}

} // namespace
} // namespace nodestat
