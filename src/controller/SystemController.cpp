#include "beacon/controller/SystemController.hpp"
#include "beacon/config/AppConfig.hpp"
#include "beacon/utils/MetricsExposition.hpp"
#include <chrono>

namespace beacon {
namespace controller {

    SystemController::SystemController(const config::AppConfig& config)
        : _collector(config.proc_root, config.cpu_sample_interval) {}

    nlohmann::json SystemController::getHealth() const {
        auto now = std::chrono::system_clock::now();
        double timestamp = std::chrono::duration<double>(now.time_since_epoch()).count();
        return {{"status", "healthy"}, {"timestamp", timestamp}};
    }

    std::string SystemController::getGreeting() const {
        return kGreeting;
    }

    std::string SystemController::getMetrics() const {
        return utils::render_exposition(_collector.get_system_metrics());
    }

}
}
