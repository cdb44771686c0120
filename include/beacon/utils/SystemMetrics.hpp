#ifndef BEACON_UTILS_SYSTEM_METRICS_HPP
#define BEACON_UTILS_SYSTEM_METRICS_HPP

#include <chrono>
#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>

namespace beacon {
namespace utils {

/**
 * @brief Raised when system counters cannot be read or parsed.
 */
class SamplerError : public std::runtime_error {
public:
    explicit SamplerError(const std::string& what) : std::runtime_error(what) {}
};

// Aggregate jiffies from the "cpu" line of /proc/stat.
struct CpuTimes {
    uint64_t user = 0;
    uint64_t nice = 0;
    uint64_t system = 0;
    uint64_t idle = 0;
    uint64_t iowait = 0;
    uint64_t irq = 0;
    uint64_t softirq = 0;
    uint64_t steal = 0;

    // guest and guest_nice are already counted in user and nice
    uint64_t total() const {
        return user + nice + system + idle + iowait + irq + softirq + steal;
    }

    uint64_t idle_all() const {
        return idle + iowait;
    }

    uint64_t busy() const {
        return total() - idle_all();
    }
};

// Values from /proc/meminfo, in kB.
struct MemoryInfo {
    uint64_t total_kb = 0;
    uint64_t available_kb = 0;
};

struct SystemMetrics {
    double cpu_usage = 0.0;
    double memory_usage = 0.0;
};

/**
 * @brief Samples host CPU and memory utilization from procfs.
 *
 * get_cpu_usage() blocks for the configured sampling window between two
 * reads of /proc/stat. Every read failure surfaces as SamplerError.
 */
class SystemMetricsCollector {
public:
    explicit SystemMetricsCollector(std::string proc_root = "/proc",
                                    std::chrono::milliseconds sample_interval = std::chrono::seconds(1));

    SystemMetrics get_system_metrics() const;
    double get_cpu_usage() const;
    double get_memory_usage() const;

    const std::string& proc_root() const { return _proc_root; }
    std::chrono::milliseconds sample_interval() const { return _sample_interval; }

    static CpuTimes parse_cpu_times(std::istream& in);
    static MemoryInfo parse_meminfo(std::istream& in);

    // Percentages are clamped to [0, 100] and rounded to one decimal.
    static double cpu_percent(const CpuTimes& before, const CpuTimes& after);
    static double memory_percent(const MemoryInfo& info);

private:
    CpuTimes read_cpu_times() const;
    MemoryInfo read_meminfo() const;

    std::string _proc_root;
    std::chrono::milliseconds _sample_interval;
};

} // namespace utils
} // namespace beacon

#endif // BEACON_UTILS_SYSTEM_METRICS_HPP
