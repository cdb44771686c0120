#ifndef BEACON_BEACON_APPLICATION_HPP
#define BEACON_BEACON_APPLICATION_HPP

#include <csignal>
#include <memory>

#include "beacon/config/AppConfig.hpp"
#include "beacon/controller/SystemController.hpp"
#include "beacon/services/HTTPServer.hpp"

namespace beacon {

/**
 * @brief Application runner
 *
 * Builds the configuration and the controller/server graph, and handles
 * startup and shutdown of the HTTP listener.
 */
class BeaconApplication {
public:
    /**
     * @brief Create application from defaults, environment and flags
     *
     * Throws config::ConfigError on invalid settings.
     */
    static std::unique_ptr<BeaconApplication> create(int argc, char** argv);

    const config::AppConfig& getConfig() const {
        return config_;
    }

    /**
     * @brief Print the banner, start serving and block until SIGINT or SIGTERM
     */
    int run();

    void shutdown();

    void printBanner() const;

private:
    explicit BeaconApplication(const config::AppConfig& app_config);

    static void setupSignalHandlers();
    static void onSignal(int signal);

    static volatile std::sig_atomic_t signal_received_;

    config::AppConfig config_;
    std::unique_ptr<controller::SystemController> controller_;
    std::unique_ptr<services::HTTPServer> server_;
};

} // namespace beacon

#endif // BEACON_BEACON_APPLICATION_HPP
