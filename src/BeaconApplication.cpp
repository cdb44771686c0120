#include "beacon/BeaconApplication.hpp"
#include <chrono>
#include <iostream>
#include <thread>

namespace beacon {

volatile std::sig_atomic_t BeaconApplication::signal_received_ = 0;

BeaconApplication::BeaconApplication(const config::AppConfig& app_config) : config_(app_config) {
    controller_ = std::make_unique<controller::SystemController>(config_);
    server_ = std::make_unique<services::HTTPServer>(config_.http_address, config_.http_port, *controller_);
}

std::unique_ptr<BeaconApplication> BeaconApplication::create(int argc, char** argv) {
    auto app_config = config::AppConfig::builder()
        .withHttpAddress("0.0.0.0")
        .withHttpPort(8080);

    // Defaults, then environment, then flags
    app_config.loadFromEnvironment();
    app_config.loadFromArguments(argc, argv);

    return std::unique_ptr<BeaconApplication>(new BeaconApplication(app_config));
}

int BeaconApplication::run() {
    signal_received_ = 0;
    printBanner();

    std::cout << "[BeaconApplication] Starting " << config_.service_name << "..." << std::endl;
    std::cout << "[BeaconApplication] HTTP Server: " << config_.http_address << ":" << config_.http_port << std::endl;
    std::cout << "[BeaconApplication] CPU sample window: " << config_.cpu_sample_interval.count() << " ms" << std::endl;
    std::cout << "[BeaconApplication] procfs: " << config_.proc_root << std::endl;

    setupSignalHandlers();
    server_->start();

    std::cout << "[BeaconApplication] " << config_.service_name << " is ready!" << std::endl;

    while (signal_received_ == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[BeaconApplication] Received signal " << signal_received_ << std::endl;
    shutdown();
    return 0;
}

void BeaconApplication::shutdown() {
    std::cout << "[BeaconApplication] Shutting down..." << std::endl;
    server_->stop();
    std::cout << "[BeaconApplication] Shutdown complete" << std::endl;
}

void BeaconApplication::printBanner() const {
    std::cout << R"(
    __
   / /_  ___  ____ __________  ____
  / __ \/ _ \/ __ `/ ___/ __ \/ __ \
 / /_/ /  __/ /_/ / /__/ /_/ / / / /
/_.___/\___/\__,_/\___/\____/_/ /_/
    )" << std::endl;
    std::cout << "Beacon - Service health and host metrics" << std::endl;
    std::cout << "========================================" << std::endl;
}

void BeaconApplication::setupSignalHandlers() {
    std::signal(SIGINT, &BeaconApplication::onSignal);
    std::signal(SIGTERM, &BeaconApplication::onSignal);
}

void BeaconApplication::onSignal(int signal) {
    signal_received_ = signal;
}

} // namespace beacon
