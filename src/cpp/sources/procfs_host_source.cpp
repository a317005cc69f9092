#include "procfs_host_source.hpp"
#include "../utils/logger.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

namespace nodestat {

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream f(path);
    if (!f.is_open()) {
        LOG_WRN("[procfs] Cannot open %s", path.c_str());
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

static bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

// ---------------------------------------------------------------------------
// /proc/stat: "cpu  user nice system idle iowait irq softirq steal ..."
// ---------------------------------------------------------------------------

bool parse_proc_stat(const std::string& text, CpuCounters& out) {
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!starts_with(line, "cpu ")) continue;

        std::istringstream ls(line.substr(4));
        CpuCounters c;
        if (!(ls >> c.user >> c.nice >> c.system >> c.idle)) return false;
        // iowait and later columns are absent on very old kernels
        ls >> c.iowait >> c.irq >> c.softirq >> c.steal;
        out = c;
        return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// /proc/diskstats: "major minor name rd rd_merged rd_sec rd_ms wr wr_merged
//                   wr_sec wr_ms in_flight io_ms weighted_ms ..."
// ---------------------------------------------------------------------------

static bool all_digits(const std::string& s, size_t from) {
    if (from >= s.size()) return false;
    for (size_t i = from; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// "sda1" of "sda", "nvme0n1p2" of "nvme0n1", "mmcblk0p1" of "mmcblk0"
static bool is_partition_of(const std::string& name, const std::string& disk) {
    if (name.size() <= disk.size() || name.compare(0, disk.size(), disk) != 0) return false;
    size_t rest = disk.size();
    if (std::isdigit(static_cast<unsigned char>(disk.back()))) {
        if (name[rest] != 'p') return false;
        ++rest;
    }
    return all_digits(name, rest);
}

// Memory-backed devices and dm/md holders stacked on real disks
static bool is_virtual_disk(const std::string& name) {
    return starts_with(name, "loop") || starts_with(name, "ram") || starts_with(name, "zram")
        || starts_with(name, "dm-") || starts_with(name, "md");
}

bool parse_diskstats(const std::string& text, const std::string& device, DiskCounters& out) {
    std::istringstream iss(text);
    std::string line;
    DiskCounters sum;
    bool found = false;
    // Whole disks seen so far; the kernel lists a disk before its partitions
    std::vector<std::string> disks;

    while (std::getline(iss, line)) {
        std::istringstream ls(line);
        unsigned major = 0, minor = 0;
        std::string name;
        uint64_t rd = 0, rd_merged = 0, rd_sec = 0, rd_ms = 0;
        uint64_t wr = 0, wr_merged = 0, wr_sec = 0, wr_ms = 0;
        uint64_t in_flight = 0, io_ms = 0;
        if (!(ls >> major >> minor >> name >> rd >> rd_merged >> rd_sec >> rd_ms
                 >> wr >> wr_merged >> wr_sec >> wr_ms >> in_flight >> io_ms)) {
            continue;
        }

        if (device.empty()) {
            if (is_virtual_disk(name)) continue;
            bool partition = false;
            for (const auto& d : disks) {
                if (is_partition_of(name, d)) {
                    partition = true;
                    break;
                }
            }
            if (partition) continue;
            disks.push_back(name);
        } else if (name != device) {
            continue;
        }

        sum.reads_completed += rd;
        sum.sectors_read += rd_sec;
        sum.writes_completed += wr;
        sum.sectors_written += wr_sec;
        sum.io_ticks_ms += io_ms;
        found = true;
        if (!device.empty()) break;
    }

    if (found) out = sum;
    return found;
}

// ---------------------------------------------------------------------------
// /proc/net/dev: two header lines, then
//   "iface: rx_bytes rx_packets errs drop fifo frame compressed multicast
//           tx_bytes ..."
// ---------------------------------------------------------------------------

bool parse_net_dev(const std::string& text, const std::string& iface, NetCounters& out) {
    std::istringstream iss(text);
    std::string line;
    NetCounters sum;
    bool found = false;

    while (std::getline(iss, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name = line.substr(0, colon);
        size_t first = name.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        name = name.substr(first);

        if (iface.empty()) {
            if (name == "lo") continue;
        } else if (name != iface) {
            continue;
        }

        std::istringstream ns(line.substr(colon + 1));
        uint64_t rx = 0, tx = 0, skip = 0;
        if (!(ns >> rx)) continue;
        for (int i = 0; i < 7; ++i) ns >> skip;
        if (!(ns >> tx)) continue;

        sum.rx_bytes += rx;
        sum.tx_bytes += tx;
        found = true;
        if (!iface.empty()) break;
    }

    if (found) out = sum;
    return found;
}

// ---------------------------------------------------------------------------
// ProcfsHostSource
// ---------------------------------------------------------------------------

bool ProcfsHostSource::read_cpu(CpuCounters& out) {
    std::string text;
    if (!read_file(path("/proc/stat"), text)) return false;
    if (!parse_proc_stat(text, out)) {
        LOG_WRN("[procfs] No aggregate cpu line in %s", path("/proc/stat").c_str());
        return false;
    }
    return true;
}

bool ProcfsHostSource::read_disk(const std::string& device, DiskCounters& out) {
    std::string text;
    if (!read_file(path("/proc/diskstats"), text)) return false;
    if (!parse_diskstats(text, device, out)) {
        LOG_WRN("[procfs] Disk '%s' not found in diskstats",
            device.empty() ? "*" : device.c_str());
        return false;
    }
    return true;
}

bool ProcfsHostSource::read_net(const std::string& iface, NetCounters& out) {
    std::string text;
    if (!read_file(path("/proc/net/dev"), text)) return false;
    if (!parse_net_dev(text, iface, out)) {
        LOG_WRN("[procfs] Interface '%s' not found in net/dev",
            iface.empty() ? "*" : iface.c_str());
        return false;
    }
    return true;
}

} // namespace nodestat
