#include "SystemMetrics.h"
#include "utils.h"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <sys/statvfs.h>

namespace fs = std::filesystem;

static std::string fixed(double v, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
    return buf;
}

bool parse_cpu_stat(std::istream& in, CpuTimes& out) {
    std::string line;
    if (!std::getline(in, line)) return false;
    std::stringstream ss(line);

    std::string cpu_label;
    ss >> cpu_label;
    if (cpu_label != "cpu") return false;

    uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0, steal = 0;
    ss >> user >> nice >> system >> idle >> iowait >> irq >> softirq >> steal;
    if (ss.fail()) return false;

    out.idle = idle + iowait;
    out.total = user + nice + system + out.idle + irq + softirq + steal;
    return true;
}

bool parse_meminfo(std::istream& in, MemInfo& out) {
    std::string line;
    while (std::getline(in, line)) {
        std::stringstream ss(line);
        std::string key;
        ss >> key;
        if (key == "MemTotal:") {
            ss >> out.total_kb;
        } else if (key == "MemAvailable:") {
            ss >> out.available_kb;
        } else if (key == "SwapTotal:") {
            ss >> out.swap_total_kb;
        } else if (key == "SwapFree:") {
            ss >> out.swap_free_kb;
        }
    }
    return out.total_kb > 0;
}

std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    if (bytes == 0) return "0 B";
    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit < 5) {
        size /= 1024.0;
        ++unit;
    }
    if (unit == 0) return std::to_string(bytes) + " B";
    return fixed(size, 2) + " " + units[unit];
}

std::string format_uptime(uint64_t seconds) {
    uint64_t days = seconds / 86400;
    uint64_t hours = (seconds % 86400) / 3600;
    uint64_t mins = (seconds % 3600) / 60;
    std::string prefix;
    if (days == 1) {
        prefix = "1 day, ";
    } else if (days > 1) {
        prefix = std::to_string(days) + " days ";
    }
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02u:%02u", static_cast<unsigned>(hours),
                  static_cast<unsigned>(mins));
    return prefix + buf;
}

SystemMetrics::SystemMetrics(SensorStore& store) : store_(store) {
    debug_ = getenv_bool("ASTER_DEBUG", false);
    interval_ms_ = getenv_int("ASTER_SYSINFO_MS", interval_ms_);
}

SystemMetrics::~SystemMetrics() {
    Stop();
}

void SystemMetrics::Start() {
    if (!running_) {
        running_ = true;
        metrics_worker_ = std::thread(&SystemMetrics::metrics_worker_func, this);
    }
}

void SystemMetrics::Stop() {
    if (running_) {
        running_ = false;
        if (metrics_worker_.joinable()) {
            metrics_worker_.join();
        }
    }
}

SensorValues SystemMetrics::Collect() {
    SensorValues sensors;
    addCpu(sensors);
    addMemory(sensors);
    addLoadAvg(sensors);
    addUptime(sensors);
    addTemperatures(sensors);
    addStorage(sensors);
    addNetwork(sensors);
    return sensors;
}

void SystemMetrics::addCpu(SensorValues& sensors) {
    std::ifstream stat_file("/proc/stat");
    CpuTimes current;
    if (!parse_cpu_stat(stat_file, current)) return;

    double usage = 0.0;
    if (prev_cpu_.total > 0 && current.total > prev_cpu_.total) {
        double total_delta = static_cast<double>(current.total - prev_cpu_.total);
        double idle_delta = static_cast<double>(current.idle - prev_cpu_.idle);
        usage = 100.0 * (1.0 - idle_delta / total_delta);
    }
    prev_cpu_ = current;

    sensors["cpu_usage_percent"] = fixed(usage, 2);
    sensors["cpu_count"] = std::to_string(std::thread::hardware_concurrency());
}

void SystemMetrics::addMemory(SensorValues& sensors) {
    std::ifstream meminfo_file("/proc/meminfo");
    MemInfo mem;
    if (!parse_meminfo(meminfo_file, mem)) return;

    uint64_t total = mem.total_kb * 1024;
    uint64_t free = mem.available_kb * 1024;
    uint64_t used = total - free;
    sensors["mem_total_bytes"] = std::to_string(total);
    sensors["mem_total"] = format_bytes(total);
    sensors["mem_free_bytes"] = std::to_string(free);
    sensors["mem_free"] = format_bytes(free);
    sensors["mem_used_bytes"] = std::to_string(used);
    sensors["mem_used"] = format_bytes(used);
    sensors["mem_usage_percent"] = fixed(used * 100.0 / total, 1);

    uint64_t swap_total = mem.swap_total_kb * 1024;
    uint64_t swap_used = swap_total - mem.swap_free_kb * 1024;
    sensors["swap_total"] = format_bytes(swap_total);
    sensors["swap_used"] = format_bytes(swap_used);
    if (swap_total > 0) {
        sensors["swap_usage_percent"] = fixed(swap_used * 100.0 / swap_total, 1);
    }
}

void SystemMetrics::addLoadAvg(SensorValues& sensors) {
    std::ifstream loadavg_file("/proc/loadavg");
    double one, five, fifteen;
    if (!(loadavg_file >> one >> five >> fifteen)) return;
    sensors["load_avg_one"] = fixed(one, 2);
    sensors["load_avg_five"] = fixed(five, 2);
    sensors["load_avg_fifteen"] = fixed(fifteen, 2);
}

void SystemMetrics::addUptime(SensorValues& sensors) {
    std::ifstream uptime_file("/proc/uptime");
    double uptime;
    if (!(uptime_file >> uptime)) return;
    uint64_t secs = static_cast<uint64_t>(uptime);
    sensors["system_uptime_sec"] = std::to_string(secs);
    sensors["system_uptime"] = format_uptime(secs);

    std::ifstream hostname_file("/proc/sys/kernel/hostname");
    std::string hostname;
    if (std::getline(hostname_file, hostname)) sensors["system_hostname"] = trim(hostname);
    std::ifstream release_file("/proc/sys/kernel/osrelease");
    std::string release;
    if (std::getline(release_file, release)) sensors["system_kernel_version"] = trim(release);
}

void SystemMetrics::addTemperatures(SensorValues& sensors) {
    std::error_code ec;
    for (const auto& zone : fs::directory_iterator("/sys/class/thermal", ec)) {
        std::string name = zone.path().filename().string();
        if (name.rfind("thermal_zone", 0) != 0) continue;

        std::ifstream temp_file(zone.path() / "temp");
        long temp_milli_c;
        if (!(temp_file >> temp_milli_c)) continue;
        std::ifstream type_file(zone.path() / "type");
        std::string type;
        std::getline(type_file, type);
        type = trim(type);

        std::string label;
        if (type == "x86_pkg_temp" || type.find("cpu") != std::string::npos ||
            type.find("soc") != std::string::npos) {
            label = "temperature_cpu";
        } else {
            label = "temperature_" + (type.empty() ? name : type);
        }
        if (sensors.count(label)) continue;
        sensors[label + "#unit"] = "°C";
        sensors[label] = fixed(temp_milli_c / 1000.0, 1);
    }
}

void SystemMetrics::addStorage(SensorValues& sensors) {
    struct statvfs vfs;
    if (statvfs("/", &vfs) != 0) return;
    unsigned long long total = static_cast<unsigned long long>(vfs.f_blocks) * vfs.f_frsize;
    unsigned long long free = static_cast<unsigned long long>(vfs.f_bavail) * vfs.f_frsize;
    if (total == 0) return;
    unsigned long long used = total - free;
    sensors["storage_ssd[0]_usage_percent"] = std::to_string((used * 100ULL) / total);
    sensors["disk_root_total"] = format_bytes(total);
    sensors["disk_root_used"] = format_bytes(used);
    sensors["disk_root_free"] = format_bytes(free);
    sensors["disk_root_usage_percent"] = fixed(used * 100.0 / total, 1);
}

void SystemMetrics::addNetwork(SensorValues& sensors) {
    static const char* prefixes[] = {"eth", "en", "em", "wlan", "wlp", "wlo"};
    auto now = std::chrono::steady_clock::now();
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator("/sys/class/net", ec)) {
        std::string ifname = entry.path().filename().string();
        bool wanted = false;
        for (const char* p : prefixes) {
            if (ifname.rfind(p, 0) == 0) wanted = true;
        }
        if (!wanted) continue;

        std::ifstream rx_file(entry.path() / "statistics" / "rx_bytes");
        std::ifstream tx_file(entry.path() / "statistics" / "tx_bytes");
        uint64_t rx, tx;
        if (!(rx_file >> rx) || !(tx_file >> tx)) continue;

        std::string base = "network_" + ifname;
        sensors[base + "_total_received"] = format_bytes(rx);
        sensors[base + "_total_transmitted"] = format_bytes(tx);

        auto prev = prev_net_stats_.find(ifname);
        if (prev != prev_net_stats_.end()) {
            double time_delta = std::chrono::duration<double>(now - prev->second.time).count();
            if (time_delta > 0) {
                uint64_t rx_delta = rx > prev->second.rx_bytes ? rx - prev->second.rx_bytes : 0;
                uint64_t tx_delta = tx > prev->second.tx_bytes ? tx - prev->second.tx_bytes : 0;
                sensors[base + "_download_speed"] =
                    format_bytes(static_cast<uint64_t>(rx_delta / time_delta)) + "/s";
                sensors[base + "_upload_speed"] =
                    format_bytes(static_cast<uint64_t>(tx_delta / time_delta)) + "/s";
                sensors[base + "_rx_mbps"] = fixed(rx_delta * 8 / (time_delta * 1000000.0), 2);
                sensors[base + "_tx_mbps"] = fixed(tx_delta * 8 / (time_delta * 1000000.0), 2);
            }
        }
        prev_net_stats_[ifname] = {rx, tx, now};
    }
}

void SystemMetrics::metrics_worker_func() {
    while (running_) {
        SensorValues sensors = Collect();
        store_.Update(sensors);
        if (debug_) {
            std::cout << "[Metrics] Updated " << sensors.size() << " system sensors" << std::endl;
        }
        for (int waited = 0; running_ && waited < interval_ms_; waited += 100) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}
