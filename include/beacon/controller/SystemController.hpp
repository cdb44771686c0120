#ifndef BEACON_CONTROLLER_SYSTEM_CONTROLLER_HPP
#define BEACON_CONTROLLER_SYSTEM_CONTROLLER_HPP

#include <string>
#include <nlohmann/json.hpp>

#include "beacon/utils/SystemMetrics.hpp"

namespace beacon {
    namespace config {
        class AppConfig;
    }
}

namespace beacon {
namespace controller {

    constexpr const char* kGreeting = "Hello! I'm a simple monitored service! \xF0\x9F\x91\x8B";

    /**
     * @brief Builds the bodies served by the HTTP layer.
     *
     * Holds no per-request state, so one instance serves all requests.
     */
    class SystemController {
    public:
        explicit SystemController(const config::AppConfig& config);

        nlohmann::json getHealth() const;
        std::string getGreeting() const;

        // Blocks for the CPU sampling window. Throws utils::SamplerError.
        std::string getMetrics() const;

    private:
        utils::SystemMetricsCollector _collector;
    };

}
}

#endif // BEACON_CONTROLLER_SYSTEM_CONTROLLER_HPP
