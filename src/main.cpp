#include <exception>
#include <iostream>
#include <memory>

#include "beacon/BeaconApplication.hpp"

int main(int argc, char** argv) {
    std::unique_ptr<beacon::BeaconApplication> app;
    try {
        app = beacon::BeaconApplication::create(argc, argv);
    } catch (const beacon::config::ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << beacon::config::AppConfig::usage(argv[0]);
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[BeaconApplication] Failed to initialize: " << e.what() << std::endl;
        return 1;
    }

    if (app->getConfig().show_help) {
        std::cout << beacon::config::AppConfig::usage(argv[0]);
        return 0;
    }

    try {
        return app->run();
    } catch (const std::exception& e) {
        std::cerr << "[BeaconApplication] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
