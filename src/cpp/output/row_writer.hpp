// =============================================================================
// RowWriter -- SampleSink rendering samples as text rows or JSON lines
//
// Text mode prints a fixed-width row per sample and repeats the column
// header every `header_every` rows (unless disabled). Columns appear only
// for the optional values the configuration turned on. Classified log
// events go to a separate stream when one is given, otherwise they are
// interleaved with the rows.
// =============================================================================

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "../config.hpp"
#include "../sampler/sampler.hpp"

namespace nodestat {

class RowWriter : public SampleSink {
public:
    // events may be the same stream as rows
    RowWriter(const SamplerConfig& config, std::ostream& rows, std::ostream& events);

    void on_sample(const Sample& sample, const std::vector<LogEvent>& events) override;
    void on_unresponsive(const std::optional<std::string>& timestamp,
                         std::optional<int64_t> epoch) override;

    std::string header_line() const;
    std::string format_row(const Sample& sample) const;
    std::string format_event(const LogEvent& event) const;

    int64_t rows_written() const { return rows_written_; }

private:
    void maybe_header();
    void write_events(const std::vector<LogEvent>& events);

    SamplerConfig config_;
    std::ostream& rows_;
    std::ostream& events_;
    int64_t rows_written_ = 0;
};

} // namespace nodestat
