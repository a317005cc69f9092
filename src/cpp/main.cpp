// =============================================================================
// nodestat -- fixed-interval sampler for a running database node
//
// Polls the node's metric registry (Jolokia), the host's CPU/disk/network
// counters and optionally the node's log, and prints one row of per-second
// rates, latencies, percentiles and compaction progress per interval.
//
// Rows go to stdout, diagnostics to stderr. Runs until --count cycles have
// completed, or forever.
// =============================================================================

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>

#include "config.hpp"
#include "utils/logger.hpp"
#include "utils/timer.hpp"
#include "sources/jolokia_source.hpp"
#include "sources/procfs_host_source.hpp"
#include "sampler/sampler.hpp"
#include "output/row_writer.hpp"

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s --keyspace NAME [OPTIONS]\n"
        "\n"
        "Options:\n"
        "  --config PATH       JSON config file (CLI flags override it)\n"
        "  --url URL           Jolokia endpoint (default: http://127.0.0.1:8778/jolokia)\n"
        "  --keyspace NAME     Keyspace to sample (required)\n"
        "  --table NAME        Table within the keyspace\n"
        "  --interval N        Seconds between samples, minimum 2 (default: 5)\n"
        "  --count N           Stop after N samples (default: run forever)\n"
        "  --disk NAME         Disk device to report (default: all)\n"
        "  --iface NAME        Network interface to report (default: all but lo)\n"
        "  --log-file PATH     Node log to classify into events\n"
        "  --events-out PATH   Write events to PATH instead of between rows\n"
        "  --epoch             Prefix rows with the unix epoch\n"
        "  --timestamp         Prefix rows with the local time\n"
        "  --no-header         Do not print column headers\n"
        "  --read-repair       Add the read-repair column\n"
        "  --compaction        Add the compaction column\n"
        "  --percentiles       Add p99/p95 latency columns (requires --table)\n"
        "  --cache             Add cache hit rate and read queue columns\n"
        "  --json              Emit JSON lines instead of text rows\n"
        "  --proc-root PATH    Read /proc files below PATH\n"
        "  --log-level LEVEL   debug, info, warn or error (default: info)\n"
        "  --verbose           Same as --log-level debug\n"
        "  --help              Show this help\n",
        prog);
}

int main(int argc, char* argv[]) {
    // First pass: the config file is the base every other flag overrides
    std::string config_path;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[i + 1];
        }
    }

    nodestat::SamplerConfig cfg;
    if (!config_path.empty()) {
        cfg = nodestat::SamplerConfig::from_json(config_path);
    }

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            ++i;
        } else if (std::strcmp(argv[i], "--url") == 0 && i + 1 < argc) {
            cfg.jolokia.url = argv[++i];
        } else if (std::strcmp(argv[i], "--keyspace") == 0 && i + 1 < argc) {
            cfg.keyspace = argv[++i];
        } else if (std::strcmp(argv[i], "--table") == 0 && i + 1 < argc) {
            cfg.table = argv[++i];
        } else if (std::strcmp(argv[i], "--interval") == 0 && i + 1 < argc) {
            cfg.interval_s = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--count") == 0 && i + 1 < argc) {
            cfg.sample_count = std::atoll(argv[++i]);
        } else if (std::strcmp(argv[i], "--disk") == 0 && i + 1 < argc) {
            cfg.disk = argv[++i];
        } else if (std::strcmp(argv[i], "--iface") == 0 && i + 1 < argc) {
            cfg.iface = argv[++i];
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            cfg.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--events-out") == 0 && i + 1 < argc) {
            cfg.events_out = argv[++i];
        } else if (std::strcmp(argv[i], "--proc-root") == 0 && i + 1 < argc) {
            cfg.proc_root = argv[++i];
        } else if (std::strcmp(argv[i], "--epoch") == 0) {
            cfg.tag_epoch = true;
        } else if (std::strcmp(argv[i], "--timestamp") == 0) {
            cfg.tag_timestamp = true;
        } else if (std::strcmp(argv[i], "--no-header") == 0) {
            cfg.header = false;
        } else if (std::strcmp(argv[i], "--read-repair") == 0) {
            cfg.show_read_repair = true;
        } else if (std::strcmp(argv[i], "--compaction") == 0) {
            cfg.show_compaction = true;
        } else if (std::strcmp(argv[i], "--percentiles") == 0) {
            cfg.show_percentiles = true;
        } else if (std::strcmp(argv[i], "--cache") == 0) {
            cfg.show_cache = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            cfg.format = nodestat::OutputFormat::JSON;
        } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            if (!nodestat::parse_log_level(argv[++i], cfg.log_level)) {
                std::fprintf(stderr, "Unknown log level: %s\n", argv[i]);
                print_usage(argv[0]);
                return 1;
            }
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            cfg.log_level = nodestat::LogLevel::DEBUG;
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
            print_usage(argv[0]);
            return 1;
        }
    }

    nodestat::g_log_level = cfg.log_level;

    // Configuration errors are the only fatal condition
    std::string err = cfg.validate();
    if (!err.empty()) {
        LOG_ERR("Configuration error: %s", err.c_str());
        print_usage(argv[0]);
        return 1;
    }

    std::unique_ptr<std::ofstream> events_file;
    if (!cfg.events_out.empty()) {
        events_file = std::make_unique<std::ofstream>(cfg.events_out, std::ios::app);
        if (!events_file->is_open()) {
            LOG_ERR("Cannot open events output %s", cfg.events_out.c_str());
            return 1;
        }
    }

    LOG_INF("=== nodestat ===");
    LOG_INF("Source: %s, output: %s", cfg.jolokia.url.c_str(),
        nodestat::output_format_str(cfg.format));

    nodestat::JolokiaSource source(cfg.jolokia);
    nodestat::ProcfsHostSource host(cfg.proc_root);
    nodestat::SteadyPacer pacer(std::chrono::seconds(cfg.interval_s));
    nodestat::RowWriter writer(cfg, std::cout,
        events_file ? static_cast<std::ostream&>(*events_file) : std::cout);

    nodestat::Sampler sampler(cfg, source, host, pacer, writer);
    sampler.run();

    return 0;
}
