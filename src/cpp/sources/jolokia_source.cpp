#include "jolokia_source.hpp"
#include "../sampler/percentile_estimator.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <curl/curl.h>

namespace nodestat {

static size_t curl_write_cb(char* ptr, size_t sz, size_t n, std::string* d) {
    d->append(ptr, sz * n);
    return sz * n;
}

// ---------------------------------------------------------------------------
// Transport
// ---------------------------------------------------------------------------

std::string JolokiaSource::post(const std::string& body) {
    CURL* c = curl_easy_init();
    if (!c) return "";

    std::string resp;
    struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");
    curl_easy_setopt(c, CURLOPT_URL, config_.url.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(c, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &resp);
    curl_easy_setopt(c, CURLOPT_TIMEOUT, config_.timeout_s);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, 2L);

    CURLcode rc = curl_easy_perform(c);
    long http_code = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &http_code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(c);

    if (rc != CURLE_OK) {
        LOG_WRN("[jolokia] POST %s failed: %s", config_.url.c_str(), curl_easy_strerror(rc));
        return "";
    }
    if (http_code != 200) {
        LOG_WRN("[jolokia] POST %s: HTTP %ld", config_.url.c_str(), http_code);
        return "";
    }
    return resp;
}

bool JolokiaSource::bulk_read(const nlohmann::json& request, nlohmann::json& response) {
    std::string resp = post(request.dump());
    if (resp.empty()) return false;

    try {
        response = nlohmann::json::parse(resp);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERR("[jolokia] JSON parse error: %s", e.what());
        return false;
    }

    if (!response.is_array() || response.size() != request.size()) {
        LOG_ERR("[jolokia] Expected %zu responses, got %s", request.size(),
            response.is_array() ? std::to_string(response.size()).c_str() : "non-array");
        return false;
    }
    return true;
}

bool JolokiaSource::read_table_counters(const std::string& keyspace, const std::string& table,
                                        TableCounters& out) {
    nlohmann::json resp;
    if (!bulk_read(jolokia::table_counters_request(keyspace, table), resp)) return false;
    return jolokia::parse_table_counters(resp, out);
}

bool JolokiaSource::read_thread_pools(ThreadPoolStats& out) {
    nlohmann::json resp;
    if (!bulk_read(jolokia::thread_pools_request(), resp)) return false;
    return jolokia::parse_thread_pools(resp, out);
}

bool JolokiaSource::read_histogram(const std::string& keyspace, const std::string& table,
                                   HistogramSnapshot& out) {
    nlohmann::json resp;
    if (!bulk_read(jolokia::histogram_request(keyspace, table), resp)) return false;
    return jolokia::parse_histogram(resp, out);
}

bool JolokiaSource::read_compactions(CompactionStats& out) {
    nlohmann::json resp;
    if (!bulk_read(jolokia::compactions_request(), resp)) return false;
    return jolokia::parse_compactions(resp, out);
}

// =============================================================================
// Requests and response parsing
// =============================================================================

namespace jolokia {

static const char* kMetrics = "org.apache.cassandra.metrics";

// --- helpers ----------------------------------------------------------------

static nlohmann::json read_op(const std::string& mbean, const nlohmann::json& attribute) {
    return {{"type", "read"}, {"mbean", mbean}, {"attribute", attribute}};
}

// The entry's "value" when the agent answered 200, otherwise nullptr
static const nlohmann::json* ok_value(const nlohmann::json& response, size_t idx) {
    if (!response.is_array() || idx >= response.size()) return nullptr;
    const auto& entry = response[idx];
    if (!entry.is_object() || entry.value("status", 0) != 200) return nullptr;
    auto it = entry.find("value");
    if (it == entry.end()) return nullptr;
    return &*it;
}

// JMX longs arrive as numbers; some agents stringify them
static bool as_int64(const nlohmann::json& v, int64_t& out) {
    if (v.is_number()) {
        out = v.get<int64_t>();
        return true;
    }
    if (v.is_string()) {
        const std::string& s = v.get_ref<const std::string&>();
        char* end = nullptr;
        long long n = std::strtoll(s.c_str(), &end, 10);
        if (end == s.c_str()) return false;
        out = n;
        return true;
    }
    return false;
}

static bool as_double(const nlohmann::json& v, double& out) {
    if (v.is_number()) {
        out = v.get<double>();
        return true;
    }
    if (v.is_string()) {
        const std::string& s = v.get_ref<const std::string&>();
        char* end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if (end == s.c_str()) return false;
        out = d;
        return true;
    }
    return false;
}

// {"Count":N,"Mean":us} -> count, mean ms
static bool parse_timer(const nlohmann::json* v, int64_t& count, double& mean_ms) {
    if (!v || !v->is_object()) return false;
    if (!v->contains("Count") || !as_int64((*v)["Count"], count)) return false;
    double mean_us = 0.0;
    if (v->contains("Mean") && as_double((*v)["Mean"], mean_us)) {
        mean_ms = mean_us / 1000.0;
    } else {
        mean_ms = 0.0;
    }
    return true;
}

// Gauge read with attribute "Value"; HitRate gauges hold a ratio in [0,1]
static std::optional<double> hit_pct(const nlohmann::json* v) {
    if (!v) return std::nullopt;
    const nlohmann::json& raw = v->is_object() && v->contains("Value") ? (*v)["Value"] : *v;
    double ratio = 0.0;
    if (!as_double(raw, ratio) || ratio != ratio) return std::nullopt;   // NaN: cache disabled
    return ratio * 100.0;
}

static bool gauge(const nlohmann::json* v, int64_t& out) {
    if (!v) return false;
    if (v->is_object()) {
        return v->contains("Value") && as_int64((*v)["Value"], out);
    }
    return as_int64(*v, out);
}

static std::string thread_pool_mbean(const char* stage, const char* name) {
    return std::string(kMetrics) + ":type=ThreadPools,path=request,scope=" + stage
        + ",name=" + name;
}

// --- requests ---------------------------------------------------------------

std::string latency_mbean(const std::string& keyspace, const std::string& table,
                          const char* name) {
    if (table.empty()) {
        return std::string(kMetrics) + ":type=Keyspace,keyspace=" + keyspace + ",name=" + name;
    }
    return std::string(kMetrics) + ":type=Table,keyspace=" + keyspace + ",scope=" + table
        + ",name=" + name;
}

nlohmann::json table_counters_request(const std::string& keyspace, const std::string& table) {
    nlohmann::json timer_attrs = nlohmann::json::array({"Count", "Mean"});
    return nlohmann::json::array({
        read_op(latency_mbean(keyspace, table, "ReadLatency"), timer_attrs),
        read_op(latency_mbean(keyspace, table, "WriteLatency"), timer_attrs),
        read_op(std::string(kMetrics) + ":type=Cache,scope=KeyCache,name=HitRate", "Value"),
        read_op(std::string(kMetrics) + ":type=Cache,scope=RowCache,name=HitRate", "Value"),
    });
}

nlohmann::json thread_pools_request() {
    return nlohmann::json::array({
        read_op(thread_pool_mbean("ReadStage", "ActiveTasks"), "Value"),
        read_op(thread_pool_mbean("ReadStage", "PendingTasks"), "Value"),
        read_op(thread_pool_mbean("ReadRepairStage", "ActiveTasks"), "Value"),
        read_op(thread_pool_mbean("ReadRepairStage", "PendingTasks"), "Value"),
        read_op(thread_pool_mbean("ReadRepairStage", "CompletedTasks"), "Value"),
    });
}

nlohmann::json histogram_request(const std::string& keyspace, const std::string& table) {
    return nlohmann::json::array({
        read_op(latency_mbean(keyspace, table, "ReadLatency"), "RecentValues"),
        read_op(latency_mbean(keyspace, table, "WriteLatency"), "RecentValues"),
    });
}

nlohmann::json compactions_request() {
    return nlohmann::json::array({
        read_op(std::string(kMetrics) + ":type=Compaction,name=PendingTasks", "Value"),
        read_op("org.apache.cassandra.db:type=CompactionManager", "Compactions"),
    });
}

// --- parsers ----------------------------------------------------------------

bool parse_table_counters(const nlohmann::json& response, TableCounters& out) {
    try {
        TableCounters tc;
        if (!parse_timer(ok_value(response, 0), tc.read_count, tc.read_latency_ms)) return false;
        if (!parse_timer(ok_value(response, 1), tc.write_count, tc.write_latency_ms)) return false;
        tc.key_cache_hit_pct = hit_pct(ok_value(response, 2));
        tc.row_cache_hit_pct = hit_pct(ok_value(response, 3));
        out = tc;
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERR("[jolokia] Bad table counter response: %s", e.what());
        return false;
    }
}

bool parse_thread_pools(const nlohmann::json& response, ThreadPoolStats& out) {
    try {
        ThreadPoolStats tp;
        if (!gauge(ok_value(response, 0), tp.read_active)) return false;
        if (!gauge(ok_value(response, 1), tp.read_pending)) return false;
        // Read-repair stage is absent on some node versions; report zeros
        gauge(ok_value(response, 2), tp.read_repair_active);
        gauge(ok_value(response, 3), tp.read_repair_pending);
        gauge(ok_value(response, 4), tp.read_repair_completed);
        out = tp;
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERR("[jolokia] Bad thread pool response: %s", e.what());
        return false;
    }
}

bool parse_histogram(const nlohmann::json& response, HistogramSnapshot& out) {
    try {
        const nlohmann::json* reads = ok_value(response, 0);
        if (!reads || !reads->is_array()) return false;
        const nlohmann::json* writes = ok_value(response, 1);

        std::vector<int64_t> read_counts;
        for (const auto& v : *reads) {
            int64_t n = 0;
            as_int64(v, n);
            read_counts.push_back(n);
        }

        std::vector<int64_t> write_counts;
        bool any_write = false;
        if (writes && writes->is_array()) {
            for (const auto& v : *writes) {
                int64_t n = 0;
                as_int64(v, n);
                write_counts.push_back(n);
                if (n != 0) any_write = true;
            }
        }

        size_t buckets = std::max(read_counts.size(), any_write ? write_counts.size() : size_t{0});
        auto bounds = percentile::bucket_offsets(buckets);

        HistogramSnapshot h;
        h.rows.reserve(buckets);
        for (size_t i = 0; i < buckets; ++i) {
            int64_t r = i < read_counts.size() ? read_counts[i] : 0;
            if (any_write) {
                int64_t w = i < write_counts.size() ? write_counts[i] : 0;
                h.rows.push_back({bounds[i], r, w});
            } else {
                h.rows.push_back({bounds[i], r});
            }
        }
        out = std::move(h);
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERR("[jolokia] Bad histogram response: %s", e.what());
        return false;
    }
}

bool parse_compactions(const nlohmann::json& response, CompactionStats& out) {
    try {
        CompactionStats cs;
        if (!gauge(ok_value(response, 0), cs.pending)) return false;

        const nlohmann::json* tasks = ok_value(response, 1);
        if (tasks && tasks->is_array()) {
            for (const auto& t : *tasks) {
                if (!t.is_object()) continue;
                CompactionTask task;
                task.type = t.value("taskType", std::string("Unknown"));
                double completed = 0.0, total = 0.0;
                if (t.contains("completed")) as_double(t["completed"], completed);
                if (t.contains("total")) as_double(t["total"], total);
                task.percent_complete = total > 0.0 ? completed / total * 100.0 : 0.0;
                cs.active.push_back(task);
            }
        }
        out = std::move(cs);
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERR("[jolokia] Bad compaction response: %s", e.what());
        return false;
    }
}

} // namespace jolokia
} // namespace nodestat
