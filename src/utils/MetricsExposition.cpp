#include "beacon/utils/MetricsExposition.hpp"
#include <prometheus/client_metric.h>
#include <prometheus/metric_type.h>
#include <prometheus/text_serializer.h>
#include <sstream>

namespace beacon {
namespace utils {

namespace {

prometheus::MetricFamily gauge_family(const std::string& name, const std::string& help, double value) {
    prometheus::ClientMetric metric;
    metric.gauge.value = value;

    prometheus::MetricFamily family;
    family.name = name;
    family.help = help;
    family.type = prometheus::MetricType::Gauge;
    family.metric.push_back(metric);
    return family;
}

} // namespace

std::vector<prometheus::MetricFamily> build_metric_families(const SystemMetrics& metrics) {
    std::vector<prometheus::MetricFamily> families;
    families.push_back(gauge_family("cpu_usage_percent", "Current CPU usage", metrics.cpu_usage));
    families.push_back(gauge_family("memory_usage_percent", "Current memory usage", metrics.memory_usage));
    families.push_back(gauge_family("app_up", "Application is running", 1.0));
    return families;
}

std::string render_exposition(const SystemMetrics& metrics) {
    std::ostringstream out;
    prometheus::TextSerializer serializer;
    serializer.Serialize(out, build_metric_families(metrics));
    return out.str();
}

} // namespace utils
} // namespace beacon
