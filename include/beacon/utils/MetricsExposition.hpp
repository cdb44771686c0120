#ifndef BEACON_UTILS_METRICS_EXPOSITION_HPP
#define BEACON_UTILS_METRICS_EXPOSITION_HPP

#include "beacon/utils/SystemMetrics.hpp"
#include <prometheus/metric_family.h>
#include <string>
#include <vector>

namespace beacon {
namespace utils {

constexpr const char* kExpositionContentType = "text/plain; version=0.0.4";

// cpu_usage_percent, memory_usage_percent and app_up, in that order.
std::vector<prometheus::MetricFamily> build_metric_families(const SystemMetrics& metrics);

std::string render_exposition(const SystemMetrics& metrics);

} // namespace utils
} // namespace beacon

#endif // BEACON_UTILS_METRICS_EXPOSITION_HPP
