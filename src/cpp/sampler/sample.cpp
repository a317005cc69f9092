#include "sample.hpp"

#include <cstdio>

namespace nodestat {

std::string CompactionSummary::to_string() const {
    std::string s = "pending:" + std::to_string(pending);
    for (const auto& t : active) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), ":%.0f%%", t.percent_complete);
        s += " " + t.type + buf;
    }
    return s;
}

nlohmann::json Sample::to_json() const {
    nlohmann::json j;
    if (timestamp) j["time"]  = *timestamp;
    if (epoch)     j["epoch"] = *epoch;

    j["reads_per_sec"]    = reads_per_sec;
    j["writes_per_sec"]   = writes_per_sec;
    j["read_latency_ms"]  = read_latency_ms;
    j["write_latency_ms"] = write_latency_ms;

    if (key_cache_hit_pct)  j["key_cache_hit_pct"]  = *key_cache_hit_pct;
    if (row_cache_hit_pct)  j["row_cache_hit_pct"]  = *row_cache_hit_pct;
    if (read_stage_pending) j["read_stage_pending"] = *read_stage_pending;

    j["cpu"] = {
        {"user", cpu.user_pct},
        {"system", cpu.system_pct},
        {"iowait", cpu.iowait_pct},
        {"idle", cpu.idle_pct}
    };
    j["disk"] = {
        {"reads_per_sec", disk.reads_per_sec},
        {"writes_per_sec", disk.writes_per_sec},
        {"read_kb_per_sec", disk.read_kb_per_sec},
        {"write_kb_per_sec", disk.write_kb_per_sec},
        {"util_pct", disk.util_pct}
    };
    j["net"] = {
        {"rx_kb_per_sec", net.rx_kb_per_sec},
        {"tx_kb_per_sec", net.tx_kb_per_sec}
    };

    if (read_repairs) j["read_repairs"] = *read_repairs;

    if (percentiles) {
        j["percentiles_ms"] = {
            {"read_p99", percentiles->read_p99_ms},
            {"read_p95", percentiles->read_p95_ms},
            {"write_p99", percentiles->write_p99_ms},
            {"write_p95", percentiles->write_p95_ms}
        };
    }

    if (compaction) {
        nlohmann::json tasks = nlohmann::json::array();
        for (const auto& t : compaction->active) {
            tasks.push_back({{"type", t.type}, {"percent", t.percent_complete}});
        }
        j["compaction"] = {{"pending", compaction->pending}, {"active", tasks}};
    }

    return j;
}

} // namespace nodestat
