// =============================================================================
// JolokiaSource -- MetricSource over the node's Jolokia JMX/HTTP bridge
//
// Each logical query is ONE bulk read: a JSON array of
//   {"type":"read","mbean":"...","attribute":...}
// POSTed to the agent URL. The agent answers with an array of
//   {"status":200,"value":...,"request":{...}}
// in request order. MBean names follow the node's metrics registry:
//
//   org.apache.cassandra.metrics:type=Table,keyspace=K,scope=T,name=ReadLatency
//   org.apache.cassandra.metrics:type=Keyspace,keyspace=K,name=WriteLatency
//   org.apache.cassandra.metrics:type=Cache,scope=KeyCache,name=HitRate
//   org.apache.cassandra.metrics:type=ThreadPools,path=request,scope=ReadStage,...
//   org.apache.cassandra.metrics:type=Compaction,name=PendingTasks
//   org.apache.cassandra.db:type=CompactionManager   (Compactions)
//
// A transport error, a non-200 entry for a required bean or malformed JSON
// turns the query into "no data"; nothing is thrown to the caller.
// =============================================================================

#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "../config.hpp"
#include "metric_source.hpp"

namespace nodestat {

class JolokiaSource : public MetricSource {
public:
    explicit JolokiaSource(const JolokiaConfig& config) : config_(config) {}

    bool read_table_counters(const std::string& keyspace, const std::string& table,
                             TableCounters& out) override;
    bool read_thread_pools(ThreadPoolStats& out) override;
    bool read_histogram(const std::string& keyspace, const std::string& table,
                        HistogramSnapshot& out) override;
    bool read_compactions(CompactionStats& out) override;

    [[nodiscard]] const char* source_name() const override { return "jolokia"; }

protected:
    // POST a bulk request; empty string on transport failure
    virtual std::string post(const std::string& body);

private:
    JolokiaConfig config_;

    // post() + parse; false on transport or JSON error
    bool bulk_read(const nlohmann::json& request, nlohmann::json& response);
};

namespace jolokia {

std::string latency_mbean(const std::string& keyspace, const std::string& table,
                          const char* name);

nlohmann::json table_counters_request(const std::string& keyspace, const std::string& table);
nlohmann::json thread_pools_request();
nlohmann::json histogram_request(const std::string& keyspace, const std::string& table);
nlohmann::json compactions_request();

// Response parsers (response = the agent's JSON array)
bool parse_table_counters(const nlohmann::json& response, TableCounters& out);
bool parse_thread_pools(const nlohmann::json& response, ThreadPoolStats& out);
bool parse_histogram(const nlohmann::json& response, HistogramSnapshot& out);
bool parse_compactions(const nlohmann::json& response, CompactionStats& out);

} // namespace jolokia
} // namespace nodestat
