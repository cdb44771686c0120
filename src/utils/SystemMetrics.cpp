#include "beacon/utils/SystemMetrics.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

namespace beacon {
namespace utils {

namespace {

double round_percent(double percent) {
    percent = std::min(100.0, std::max(0.0, percent));
    return std::round(percent * 10.0) / 10.0;
}

} // namespace

SystemMetricsCollector::SystemMetricsCollector(std::string proc_root, std::chrono::milliseconds sample_interval)
    : _proc_root(std::move(proc_root)), _sample_interval(sample_interval) {}

SystemMetrics SystemMetricsCollector::get_system_metrics() const {
    SystemMetrics metrics;
    metrics.cpu_usage = get_cpu_usage();
    metrics.memory_usage = get_memory_usage();
    return metrics;
}

double SystemMetricsCollector::get_cpu_usage() const {
    CpuTimes before = read_cpu_times();
    std::this_thread::sleep_for(_sample_interval);
    CpuTimes after = read_cpu_times();
    return cpu_percent(before, after);
}

double SystemMetricsCollector::get_memory_usage() const {
    return memory_percent(read_meminfo());
}

CpuTimes SystemMetricsCollector::read_cpu_times() const {
    std::string path = _proc_root + "/stat";
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SamplerError("Cannot open " + path);
    }
    return parse_cpu_times(file);
}

MemoryInfo SystemMetricsCollector::read_meminfo() const {
    std::string path = _proc_root + "/meminfo";
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SamplerError("Cannot open " + path);
    }
    return parse_meminfo(file);
}

CpuTimes SystemMetricsCollector::parse_cpu_times(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string label;
        fields >> label;
        if (label != "cpu") {
            continue;
        }

        std::vector<uint64_t> values;
        uint64_t value;
        while (values.size() < 8 && fields >> value) {
            values.push_back(value);
        }
        // user, nice, system and idle exist on every kernel
        if (values.size() < 4) {
            throw SamplerError("Malformed cpu line in stat: '" + line + "'");
        }
        values.resize(8, 0);

        CpuTimes times;
        times.user = values[0];
        times.nice = values[1];
        times.system = values[2];
        times.idle = values[3];
        times.iowait = values[4];
        times.irq = values[5];
        times.softirq = values[6];
        times.steal = values[7];
        return times;
    }
    throw SamplerError("No aggregate cpu line in stat");
}

MemoryInfo SystemMetricsCollector::parse_meminfo(std::istream& in) {
    bool has_total = false;
    bool has_available = false;
    uint64_t total = 0, available = 0, free = 0, buffers = 0, cached = 0;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string key;
        uint64_t value = 0;
        if (!(fields >> key >> value)) {
            continue;
        }

        if (key == "MemTotal:") {
            total = value;
            has_total = true;
        } else if (key == "MemAvailable:") {
            available = value;
            has_available = true;
        } else if (key == "MemFree:") {
            free = value;
        } else if (key == "Buffers:") {
            buffers = value;
        } else if (key == "Cached:") {
            cached = value;
        }
    }

    if (!has_total || total == 0) {
        throw SamplerError("MemTotal missing from meminfo");
    }

    MemoryInfo info;
    info.total_kb = total;
    // Kernels before 3.14 do not report MemAvailable
    info.available_kb = has_available ? available : free + buffers + cached;
    return info;
}

double SystemMetricsCollector::cpu_percent(const CpuTimes& before, const CpuTimes& after) {
    // Counters can step backwards across a CPU hotplug
    if (after.total() <= before.total()) {
        return 0.0;
    }
    double total_delta = static_cast<double>(after.total() - before.total());
    double busy_delta = static_cast<double>(after.busy()) - static_cast<double>(before.busy());
    return round_percent(busy_delta / total_delta * 100.0);
}

double SystemMetricsCollector::memory_percent(const MemoryInfo& info) {
    if (info.total_kb == 0) {
        throw SamplerError("MemTotal is zero");
    }
    double used = static_cast<double>(info.total_kb) - static_cast<double>(info.available_kb);
    return round_percent(used / static_cast<double>(info.total_kb) * 100.0);
}

} // namespace utils
} // namespace beacon
