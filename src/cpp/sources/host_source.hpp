#pragma once
// Cumulative OS counters for the machine hosting the node
#include <cstdint>
#include <string>

namespace nodestat {

// Aggregate jiffies from the "cpu" line of /proc/stat
struct CpuCounters {
    uint64_t user = 0;
    uint64_t nice = 0;
    uint64_t system = 0;
    uint64_t idle = 0;
    uint64_t iowait = 0;
    uint64_t irq = 0;
    uint64_t softirq = 0;
    uint64_t steal = 0;

    [[nodiscard]] uint64_t total() const {
        return user + nice + system + idle + iowait + irq + softirq + steal;
    }
};

struct DiskCounters {
    uint64_t reads_completed = 0;
    uint64_t sectors_read = 0;
    uint64_t writes_completed = 0;
    uint64_t sectors_written = 0;
    uint64_t io_ticks_ms = 0;
};

struct NetCounters {
    uint64_t rx_bytes = 0;
    uint64_t tx_bytes = 0;
};

class HostSource {
public:
    virtual ~HostSource() = default;

    virtual bool read_cpu(CpuCounters& out) = 0;

    // Empty name: sum over all whole physical disks (no partitions or
    // device-mapper/md holders) / all interfaces but loopback
    virtual bool read_disk(const std::string& device, DiskCounters& out) = 0;
    virtual bool read_net(const std::string& iface, NetCounters& out) = 0;
};

} // namespace nodestat
