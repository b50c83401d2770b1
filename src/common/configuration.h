#ifndef COMPLETENESS_CONFIGURATION_H_
#define COMPLETENESS_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "common/config.h"

namespace Completeness {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * How NumValidWindows decides that a scanned entry is the active window
 */
enum class ActiveWindowExclusion {
    // Compare the scanned window id with the active-window marker
    kWindowId,
    // Compare the scanned window's valid-partition total with the marker
    kLegacyPartitionCount,
};

// Returns false if `name` is not a known exclusion mode.
bool ParseActiveWindowExclusion(const std::string& name, ActiveWindowExclusion& out);
const char* ActiveWindowExclusionName(ActiveWindowExclusion mode);

/**
 * Main configuration structure
 */
struct CompletenessConfig {
    struct Checker {
        ConfigValue<int> max_num_windows{kDefaultMaxNumWindows, "COMPLETENESS_MAX_NUM_WINDOWS"};
        ConfigValue<std::string> active_window_exclusion{"window_id", "COMPLETENESS_ACTIVE_WINDOW_EXCLUSION"};
    } checker;

    struct Monitor {
        ConfigValue<int64_t> window_ms{kDefaultWindowMs, "COMPLETENESS_WINDOW_MS"};
        ConfigValue<double> min_monitored_partitions_percentage{
            kDefaultMinMonitoredPartitionsPercentage, "COMPLETENESS_MIN_MONITORED_PCT"};
        ConfigValue<int> num_windows_to_retain{kDefaultMaxNumWindows, "COMPLETENESS_NUM_WINDOWS_TO_RETAIN"};
    } monitor;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Override with command line arguments
    void overrideFromCommandLine(int argc, char* argv[]);

    // Get the configuration
    const CompletenessConfig& config() const { return config_; }
    CompletenessConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getMaxNumWindows() const { return config_.checker.max_num_windows.get(); }
    int64_t getWindowMs() const { return config_.monitor.window_ms.get(); }
    double getMinMonitoredPartitionsPercentage() const {
        return config_.monitor.min_monitored_partitions_percentage.get();
    }
    int getNumWindowsToRetain() const { return config_.monitor.num_windows_to_retain.get(); }
    // Falls back to kWindowId for an unknown name; validate() reports it.
    ActiveWindowExclusion getActiveWindowExclusion() const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Restore every value to its default. Used by tests.
    void reset() { config_ = CompletenessConfig{}; validation_errors_.clear(); }

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    CompletenessConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Shared by loadFromFile and loadFromString; takes a YAML::Node
    void parseRoot(const void* yaml_root);
};

// Global accessor
const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace Completeness

#endif // COMPLETENESS_CONFIGURATION_H_
