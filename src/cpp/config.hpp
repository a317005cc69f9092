#pragma once
#include <cstdint>
#include <string>
#include <fstream>
#include <nlohmann/json.hpp>
#include "utils/logger.hpp"

namespace nodestat {

enum class OutputFormat { TEXT, JSON };

inline const char* output_format_str(OutputFormat f) {
    switch (f) {
        case OutputFormat::TEXT: return "text";
        case OutputFormat::JSON: return "json";
    }
    return "??";
}

inline OutputFormat parse_output_format(const std::string& s) {
    if (s == "json") return OutputFormat::JSON;
    return OutputFormat::TEXT;
}

// Jolokia JMX-over-HTTP endpoint of the monitored node
struct JolokiaConfig {
    std::string url = "http://127.0.0.1:8778/jolokia";
    long timeout_s = 5;
};

// Full sampler configuration (JSON file, then CLI overrides)
struct SamplerConfig {
    JolokiaConfig jolokia;

    // Target resource
    std::string keyspace;           // required
    std::string table;              // sub-resource, required for percentiles

    // Loop
    int interval_s = 5;             // minimum 2
    int64_t sample_count = 0;       // <= 0: run forever

    // Host devices (empty = aggregate)
    std::string disk;
    std::string iface;
    std::string proc_root;          // prefix for /proc (tests)

    // Log classification
    std::string log_file;
    std::string events_out;         // empty: interleave with rows

    // Optional columns
    bool tag_epoch = false;
    bool tag_timestamp = false;
    bool show_read_repair = false;
    bool show_compaction = false;
    bool show_percentiles = false;
    bool show_cache = false;

    // Presentation
    OutputFormat format = OutputFormat::TEXT;
    bool header = true;
    int header_every = 10;

    // Diagnostics on stderr
    LogLevel log_level = LogLevel::INFO;

    static constexpr int kMinIntervalSeconds = 2;

    static SamplerConfig from_json(const std::string& path);

    // Empty on success, otherwise the reason the loop must not start.
    [[nodiscard]] std::string validate() const;
};

inline SamplerConfig SamplerConfig::from_json(const std::string& path) {
    SamplerConfig cfg;

    std::ifstream f(path);
    if (!f.is_open()) {
        LOG_WRN("[config] Cannot open %s, using defaults", path.c_str());
        return cfg;
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERR("[config] %s: JSON parse error: %s", path.c_str(), e.what());
        return cfg;
    }

    try {
        if (j.contains("jolokia")) {
            cfg.jolokia.url = j["jolokia"].value("url", cfg.jolokia.url);
            cfg.jolokia.timeout_s = j["jolokia"].value("timeout_s", cfg.jolokia.timeout_s);
        }

        cfg.keyspace = j.value("keyspace", cfg.keyspace);
        cfg.table = j.value("table", cfg.table);
        cfg.interval_s = j.value("interval_s", cfg.interval_s);
        cfg.sample_count = j.value("sample_count", cfg.sample_count);
        cfg.disk = j.value("disk", cfg.disk);
        cfg.iface = j.value("iface", cfg.iface);
        cfg.proc_root = j.value("proc_root", cfg.proc_root);
        cfg.log_file = j.value("log_file", cfg.log_file);
        cfg.events_out = j.value("events_out", cfg.events_out);

        if (j.contains("log_level")) {
            std::string level = j["log_level"].get<std::string>();
            if (!parse_log_level(level, cfg.log_level)) {
                LOG_WRN("[config] Unknown log_level '%s', keeping %s",
                    level.c_str(), log_level_str(cfg.log_level));
            }
        }

        if (j.contains("columns")) {
            const auto& c = j["columns"];
            cfg.tag_epoch = c.value("epoch", cfg.tag_epoch);
            cfg.tag_timestamp = c.value("timestamp", cfg.tag_timestamp);
            cfg.show_read_repair = c.value("read_repair", cfg.show_read_repair);
            cfg.show_compaction = c.value("compaction", cfg.show_compaction);
            cfg.show_percentiles = c.value("percentiles", cfg.show_percentiles);
            cfg.show_cache = c.value("cache", cfg.show_cache);
        }

        if (j.contains("output")) {
            const auto& o = j["output"];
            cfg.format = parse_output_format(o.value("format", std::string("text")));
            cfg.header = o.value("header", cfg.header);
            cfg.header_every = o.value("header_every", cfg.header_every);
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERR("[config] %s: bad value: %s", path.c_str(), e.what());
        return SamplerConfig{};
    }

    return cfg;
}

inline std::string SamplerConfig::validate() const {
    if (keyspace.empty())
        return "a target keyspace is required (--keyspace)";
    if (interval_s < kMinIntervalSeconds)
        return "sampling interval must be at least " +
               std::to_string(kMinIntervalSeconds) + " seconds";
    if (show_percentiles && table.empty())
        return "percentile columns require a table (--table)";
    if (header_every < 1)
        return "header_every must be at least 1";
    return "";
}

} // namespace nodestat
