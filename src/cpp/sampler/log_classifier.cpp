#include "log_classifier.hpp"
#include "../utils/logger.hpp"

#include <fstream>
#include <sstream>

namespace nodestat {

const char* event_tag_str(EventTag tag) {
    switch (tag) {
        case EventTag::COMMITLOG_CREATED:         return "CommitlogCreated";
        case EventTag::FLUSH_COMPLETED:           return "FlushCompleted";
        case EventTag::MAJOR_COMPACTION_STARTED:  return "MajorCompactionStarted";
        case EventTag::TREE_SENT:                 return "TreeSent";
        case EventTag::REPAIR_STARTED:            return "RepairStarted";
        case EventTag::MANUAL_REPAIR_SESSION:     return "ManualRepairSession";
        case EventTag::STREAMING_REPAIR_PROGRESS: return "StreamingRepairProgress";
        case EventTag::STREAMING_REPAIR_FINISHED: return "StreamingRepairFinished";
        case EventTag::REPAIR_COMMAND_FINISHED:   return "RepairCommandFinished";
        case EventTag::COMPACTION_COMPLETED:      return "CompactionCompleted";
    }
    return "??";
}

nlohmann::json LogEvent::to_json() const {
    nlohmann::json j;
    j["ts"]     = timestamp;
    j["event"]  = event_tag_str(tag);
    j["fields"] = fields;
    return j;
}

namespace logscan {

const std::vector<EventTemplate>& default_templates() {
    static const std::vector<EventTemplate> templates = {
        {"new commitlog created",        EventTag::COMMITLOG_CREATED,         {}},
        {"flush completed",              EventTag::FLUSH_COMPLETED,           {}},
        {"major compaction started",     EventTag::MAJOR_COMPACTION_STARTED,  {}},
        {"anti-entropy tree sent",       EventTag::TREE_SENT,                 {-3, -2, -1}},
        {"repair started",               EventTag::REPAIR_STARTED,            {-2}},
        {"manual repair session",        EventTag::MANUAL_REPAIR_SESSION,     {-1}},
        {"streaming repair in progress", EventTag::STREAMING_REPAIR_PROGRESS, {-6, -3, -1}},
        {"streaming repair finished",    EventTag::STREAMING_REPAIR_FINISHED, {}},
        // Own tag, never reported as StreamingRepairFinished
        {"repair command issued",        EventTag::REPAIR_COMMAND_FINISHED,   {}},
        {"compaction output written",    EventTag::COMPACTION_COMPLETED,      {}},
    };
    return templates;
}

static std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string tok;
    while (iss >> tok) tokens.push_back(tok);
    return tokens;
}

static std::string token_at(const std::vector<std::string>& tokens, int pos) {
    auto n = static_cast<int>(tokens.size());
    int idx = pos > 0 ? pos - 1 : n + pos;
    if (pos == 0 || idx < 0 || idx >= n) return "";
    return tokens[idx];
}

std::optional<LogEvent> classify_line(const std::string& line,
                                      const std::vector<EventTemplate>& templates) {
    for (const auto& t : templates) {
        if (line.find(t.trigger) == std::string::npos) continue;

        auto tokens = tokenize(line);
        LogEvent ev;
        ev.timestamp = token_at(tokens, kTimestampToken);
        ev.tag = t.tag;
        for (int pos : t.field_positions) {
            ev.fields.push_back(token_at(tokens, pos));
        }
        return ev;
    }
    return std::nullopt;
}

int64_t count_lines(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_DBG("[logscan] Cannot open %s", path.c_str());
        return 0;
    }

    int64_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (in.eof()) break;    // trailing partial line
        ++n;
    }
    return n;
}

ScanResult extract_events(const std::string& path, int64_t watermark,
                          const std::vector<EventTemplate>& templates) {
    ScanResult result;
    result.watermark = watermark;

    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_WRN("[logscan] Cannot open %s", path.c_str());
        return result;
    }

    std::vector<LogEvent> events;
    int64_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (in.eof()) break;    // not yet newline-terminated, pick up next cycle
        ++n;
        if (n <= watermark) continue;
        if (auto ev = classify_line(line, templates)) {
            events.push_back(std::move(*ev));
        }
    }

    if (n <= watermark) {
        if (n < watermark) {
            LOG_DBG("[logscan] %s shrank to %lld lines (watermark %lld)", path.c_str(),
                static_cast<long long>(n), static_cast<long long>(watermark));
        }
        return result;
    }

    LOG_DBG("[logscan] %s: lines %lld..%lld, %zu events", path.c_str(),
        static_cast<long long>(watermark + 1), static_cast<long long>(n), events.size());
    result.events = std::move(events);
    result.watermark = n;
    return result;
}

} // namespace logscan
} // namespace nodestat
