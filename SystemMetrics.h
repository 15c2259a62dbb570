#ifndef SYSTEM_METRICS_H
#define SYSTEM_METRICS_H

#include "SensorStore.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <istream>
#include <map>
#include <string>
#include <thread>

struct CpuTimes {
    uint64_t idle = 0;   // idle + iowait
    uint64_t total = 0;
};

struct MemInfo {
    uint64_t total_kb = 0;
    uint64_t available_kb = 0;
    uint64_t swap_total_kb = 0;
    uint64_t swap_free_kb = 0;
};

// First "cpu" line of /proc/stat.
bool parse_cpu_stat(std::istream& in, CpuTimes& out);
bool parse_meminfo(std::istream& in, MemInfo& out);

// "1.50 GB", "512 B"
std::string format_bytes(uint64_t bytes);
// "HH:MM", prefixed with "1 day, " or "N days "
std::string format_uptime(uint64_t seconds);

// Built-in system information poller. Publishes labels such as cpu_usage_percent,
// mem_usage_percent, load_avg_one, system_uptime and temperature_cpu.
class SystemMetrics {
public:
    explicit SystemMetrics(SensorStore& store);
    ~SystemMetrics();

    void Start();
    void Stop();

    // Read all sources once.
    SensorValues Collect();

private:
    void metrics_worker_func();

    void addCpu(SensorValues& sensors);
    void addMemory(SensorValues& sensors);
    void addLoadAvg(SensorValues& sensors);
    void addUptime(SensorValues& sensors);
    void addTemperatures(SensorValues& sensors);
    void addStorage(SensorValues& sensors);
    void addNetwork(SensorValues& sensors);

    SensorStore& store_;
    int interval_ms_ = 2000;

    // For CPU calculation
    CpuTimes prev_cpu_;

    // For network speed calculation
    struct NetStats {
        uint64_t rx_bytes;
        uint64_t tx_bytes;
        std::chrono::steady_clock::time_point time;
    };
    std::map<std::string, NetStats> prev_net_stats_;

    std::thread metrics_worker_;
    std::atomic<bool> running_{false};
    bool debug_ = false;
};

#endif // SYSTEM_METRICS_H
