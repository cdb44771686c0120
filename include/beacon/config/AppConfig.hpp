#ifndef BEACON_CONFIG_APP_CONFIG_HPP
#define BEACON_CONFIG_APP_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

namespace beacon {
namespace config {

/**
 * @brief Raised when a configuration value cannot be used.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Application configuration
 *
 * Holds the startup settings of the service. Built once from defaults,
 * then environment variables, then command line flags, and passed by
 * reference to the components that need it.
 */
class AppConfig {
public:
    // Server configuration
    std::string http_address = "0.0.0.0";
    uint16_t http_port = 8080;
    std::string service_name = "beacon";

    // Sampler configuration
    std::chrono::milliseconds cpu_sample_interval{1000};
    std::string proc_root = "/proc";

    bool show_help = false;

    // Builder pattern for easier configuration
    static AppConfig builder() {
        return AppConfig();
    }

    AppConfig& withHttpAddress(const std::string& address) {
        http_address = address;
        return *this;
    }

    AppConfig& withHttpPort(uint16_t port) {
        http_port = port;
        return *this;
    }

    AppConfig& withServiceName(const std::string& name) {
        service_name = name;
        return *this;
    }

    AppConfig& withCpuSampleInterval(std::chrono::milliseconds interval) {
        cpu_sample_interval = interval;
        return *this;
    }

    AppConfig& withProcRoot(const std::string& root) {
        proc_root = root;
        return *this;
    }

    /**
     * @brief Load configuration from environment variables
     *
     * Only variables that are set override the current values.
     */
    void loadFromEnvironment() {
        const char* env_value;

        if ((env_value = getenv("BEACON_HTTP_ADDRESS")) != nullptr) {
            http_address = env_value;
        }

        if ((env_value = getenv("BEACON_HTTP_PORT")) != nullptr) {
            http_port = parsePort(env_value, "BEACON_HTTP_PORT");
        }

        if ((env_value = getenv("BEACON_CPU_SAMPLE_MS")) != nullptr) {
            cpu_sample_interval = parseMilliseconds(env_value, "BEACON_CPU_SAMPLE_MS");
        }

        if ((env_value = getenv("BEACON_PROC_ROOT")) != nullptr) {
            proc_root = env_value;
        }

        if ((env_value = getenv("BEACON_SERVICE_NAME")) != nullptr) {
            service_name = env_value;
        }
    }

    /**
     * @brief Apply command line flags on top of the current values
     *
     * Recognized: --host, --port, --cpu-sample-ms, --proc-root, --help.
     * Throws ConfigError for unknown flags or missing values.
     */
    void loadFromArguments(int argc, char** argv) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                show_help = true;
                continue;
            }

            if (i + 1 >= argc) {
                throw ConfigError("Missing value for " + arg);
            }
            std::string value = argv[++i];

            if (arg == "--host") {
                http_address = value;
            } else if (arg == "--port") {
                http_port = parsePort(value, arg);
            } else if (arg == "--cpu-sample-ms") {
                cpu_sample_interval = parseMilliseconds(value, arg);
            } else if (arg == "--proc-root") {
                proc_root = value;
            } else {
                throw ConfigError("Unknown option " + arg);
            }
        }
    }

    static std::string usage(const std::string& program) {
        std::ostringstream out;
        out << "Usage: " << program << " [options]\n"
            << "  --host <address>       bind address (default 0.0.0.0, env BEACON_HTTP_ADDRESS)\n"
            << "  --port <port>          bind port (default 8080, env BEACON_HTTP_PORT)\n"
            << "  --cpu-sample-ms <ms>   CPU sampling window (default 1000, env BEACON_CPU_SAMPLE_MS)\n"
            << "  --proc-root <dir>      procfs mount point (default /proc, env BEACON_PROC_ROOT)\n"
            << "  -h, --help             show this message\n";
        return out.str();
    }

    static uint16_t parsePort(const std::string& value, const std::string& source) {
        unsigned long port = parseUnsigned(value, source);
        if (port == 0 || port > 65535) {
            throw ConfigError(source + ": port out of range: " + value);
        }
        return static_cast<uint16_t>(port);
    }

    static std::chrono::milliseconds parseMilliseconds(const std::string& value, const std::string& source) {
        return std::chrono::milliseconds(parseUnsigned(value, source));
    }

private:
    static unsigned long parseUnsigned(const std::string& value, const std::string& source) {
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            throw ConfigError(source + ": not a non-negative integer: '" + value + "'");
        }
        try {
            return std::stoul(value);
        } catch (const std::out_of_range&) {
            throw ConfigError(source + ": value too large: " + value);
        }
    }
};

} // namespace config
} // namespace beacon

#endif // BEACON_CONFIG_APP_CONFIG_HPP
