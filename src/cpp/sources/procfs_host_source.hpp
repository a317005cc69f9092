#pragma once
// HostSource backed by /proc/stat, /proc/diskstats and /proc/net/dev
#include <string>
#include <utility>
#include "host_source.hpp"

namespace nodestat {

class ProcfsHostSource : public HostSource {
public:
    // proc_root is prepended to every /proc path (empty for the live system)
    explicit ProcfsHostSource(std::string proc_root = "")
        : proc_root_(std::move(proc_root)) {}

    bool read_cpu(CpuCounters& out) override;
    bool read_disk(const std::string& device, DiskCounters& out) override;
    bool read_net(const std::string& iface, NetCounters& out) override;

private:
    std::string proc_root_;

    std::string path(const char* rel) const { return proc_root_ + rel; }
};

// Parsers over the raw file text, exposed for tests
bool parse_proc_stat(const std::string& text, CpuCounters& out);
bool parse_diskstats(const std::string& text, const std::string& device, DiskCounters& out);
bool parse_net_dev(const std::string& text, const std::string& iface, NetCounters& out);

} // namespace nodestat
