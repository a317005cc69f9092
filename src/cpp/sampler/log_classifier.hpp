#pragma once
// =============================================================================
// LogEventClassifier -- incremental scan of the node's append-only log
//
// The caller owns a watermark: the number of complete lines already
// consumed. Each scan reads only lines (watermark, line_count], classifies
// them against an ordered template table (first match wins) and hands back
// the new watermark. A line is classified at most once.
//
// A log that shrank below the watermark (rotated or truncated) yields no
// events and leaves the watermark unchanged until the new file outgrows it.
// =============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace nodestat {

enum class EventTag {
    COMMITLOG_CREATED,
    FLUSH_COMPLETED,
    MAJOR_COMPACTION_STARTED,
    TREE_SENT,
    REPAIR_STARTED,
    MANUAL_REPAIR_SESSION,
    STREAMING_REPAIR_PROGRESS,
    STREAMING_REPAIR_FINISHED,
    REPAIR_COMMAND_FINISHED,
    COMPACTION_COMPLETED
};

const char* event_tag_str(EventTag tag);

struct LogEvent {
    std::string timestamp;
    EventTag tag;
    std::vector<std::string> fields;

    nlohmann::json to_json() const;
};

// One classification rule. Token positions are 1-based over whitespace
// tokens; negative positions count from the end (-1 is the last token).
struct EventTemplate {
    const char* trigger;
    EventTag tag;
    std::vector<int> field_positions;
};

namespace logscan {

constexpr int kTimestampToken = 4;

const std::vector<EventTemplate>& default_templates();

std::optional<LogEvent> classify_line(const std::string& line,
                                      const std::vector<EventTemplate>& templates);

// Newline-terminated lines; 0 when the file is missing or unreadable
int64_t count_lines(const std::string& path);

struct ScanResult {
    std::vector<LogEvent> events;
    int64_t watermark = 0;
};

ScanResult extract_events(const std::string& path, int64_t watermark,
                          const std::vector<EventTemplate>& templates = default_templates());

} // namespace logscan
} // namespace nodestat
