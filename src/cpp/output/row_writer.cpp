#include "row_writer.hpp"
#include "../sampler/percentile_estimator.hpp"

#include <cstdarg>
#include <cstdio>
#include <nlohmann/json.hpp>

namespace nodestat {

static void appendf(std::string& out, const char* fmt, ...) {
    char buf[128];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    out += buf;
}

RowWriter::RowWriter(const SamplerConfig& config, std::ostream& rows, std::ostream& events)
    : config_(config), rows_(rows), events_(events)
{
}

// ---------------------------------------------------------------------------
// Text layout
// ---------------------------------------------------------------------------

std::string RowWriter::header_line() const {
    std::string h;
    if (config_.tag_epoch)     appendf(h, "%10s ", "epoch");
    if (config_.tag_timestamp) appendf(h, "%8s ", "time");
    appendf(h, "%8s %8s %8s %8s", "reads/s", "writes/s", "rlat_ms", "wlat_ms");
    if (config_.show_cache)    appendf(h, " %6s %6s %6s", "kc%", "rc%", "rdpnd");
    appendf(h, " %5s %5s %5s %5s", "usr", "sys", "wai", "idl");
    appendf(h, " %6s %6s %8s %8s %5s", "dr/s", "dw/s", "drkB/s", "dwkB/s", "util");
    appendf(h, " %8s %8s", "rxkB/s", "txkB/s");
    if (config_.show_read_repair) appendf(h, " %6s", "rrep");
    if (config_.show_percentiles) appendf(h, " %8s %8s %8s %8s", "r99_ms", "r95_ms", "w99_ms", "w95_ms");
    if (config_.show_compaction)  appendf(h, "  %s", "compaction");
    return h;
}

std::string RowWriter::format_row(const Sample& s) const {
    std::string r;
    if (config_.tag_epoch)
        appendf(r, "%10lld ", static_cast<long long>(s.epoch.value_or(0)));
    if (config_.tag_timestamp)
        appendf(r, "%8s ", s.timestamp.value_or("").c_str());

    appendf(r, "%8lld %8lld %8.3f %8.3f",
        static_cast<long long>(s.reads_per_sec), static_cast<long long>(s.writes_per_sec),
        s.read_latency_ms, s.write_latency_ms);

    if (config_.show_cache) {
        if (s.key_cache_hit_pct) appendf(r, " %6.1f", *s.key_cache_hit_pct);
        else                     appendf(r, " %6s", "-");
        if (s.row_cache_hit_pct) appendf(r, " %6.1f", *s.row_cache_hit_pct);
        else                     appendf(r, " %6s", "-");
        if (s.read_stage_pending) appendf(r, " %6lld", static_cast<long long>(*s.read_stage_pending));
        else                      appendf(r, " %6s", "-");
    }

    appendf(r, " %5.1f %5.1f %5.1f %5.1f",
        s.cpu.user_pct, s.cpu.system_pct, s.cpu.iowait_pct, s.cpu.idle_pct);
    appendf(r, " %6lld %6lld %8lld %8lld %5.1f",
        static_cast<long long>(s.disk.reads_per_sec), static_cast<long long>(s.disk.writes_per_sec),
        static_cast<long long>(s.disk.read_kb_per_sec), static_cast<long long>(s.disk.write_kb_per_sec),
        s.disk.util_pct);
    appendf(r, " %8lld %8lld",
        static_cast<long long>(s.net.rx_kb_per_sec), static_cast<long long>(s.net.tx_kb_per_sec));

    if (config_.show_read_repair) {
        if (s.read_repairs) appendf(r, " %6lld", static_cast<long long>(*s.read_repairs));
        else                appendf(r, " %6s", "-");
    }

    if (config_.show_percentiles) {
        if (s.percentiles) {
            const auto& p = *s.percentiles;
            appendf(r, " %8s %8s %8s %8s",
                percentile::format_ms(p.read_p99_ms).c_str(),
                percentile::format_ms(p.read_p95_ms).c_str(),
                percentile::format_ms(p.write_p99_ms).c_str(),
                percentile::format_ms(p.write_p95_ms).c_str());
        } else {
            appendf(r, " %8s %8s %8s %8s", "-", "-", "-", "-");
        }
    }

    if (config_.show_compaction) {
        r += "  ";
        r += s.compaction ? s.compaction->to_string() : "-";
    }
    return r;
}

std::string RowWriter::format_event(const LogEvent& ev) const {
    std::string line = "[event] " + ev.timestamp + " " + event_tag_str(ev.tag);
    for (const auto& f : ev.fields) line += " " + f;
    return line;
}

// ---------------------------------------------------------------------------
// SampleSink
// ---------------------------------------------------------------------------

void RowWriter::maybe_header() {
    if (config_.format != OutputFormat::TEXT || !config_.header) return;
    if (rows_written_ % config_.header_every == 0) {
        rows_ << header_line() << '\n';
    }
}

void RowWriter::write_events(const std::vector<LogEvent>& events) {
    for (const auto& ev : events) {
        if (config_.format == OutputFormat::JSON) {
            events_ << ev.to_json().dump() << '\n';
        } else {
            events_ << format_event(ev) << '\n';
        }
    }
    if (!events.empty()) events_.flush();
}

void RowWriter::on_sample(const Sample& sample, const std::vector<LogEvent>& events) {
    maybe_header();
    if (config_.format == OutputFormat::JSON) {
        rows_ << sample.to_json().dump() << '\n';
    } else {
        rows_ << format_row(sample) << '\n';
    }
    ++rows_written_;
    rows_.flush();

    write_events(events);
}

void RowWriter::on_unresponsive(const std::optional<std::string>& timestamp,
                                std::optional<int64_t> epoch) {
    maybe_header();
    if (config_.format == OutputFormat::JSON) {
        nlohmann::json j;
        if (timestamp) j["time"] = *timestamp;
        if (epoch) j["epoch"] = *epoch;
        j["unresponsive"] = true;
        rows_ << j.dump() << '\n';
    } else {
        std::string r;
        if (config_.tag_epoch)     appendf(r, "%10lld ", static_cast<long long>(epoch.value_or(0)));
        if (config_.tag_timestamp) appendf(r, "%8s ", timestamp.value_or("").c_str());
        r += "-- node unresponsive --";
        rows_ << r << '\n';
    }
    ++rows_written_;
    rows_.flush();
}

} // namespace nodestat
