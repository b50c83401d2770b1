#include "configuration.h"
#include <cstdlib>
#include <getopt.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Completeness {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
}

bool ParseActiveWindowExclusion(const std::string& name, ActiveWindowExclusion& out) {
    if (name == "window_id") {
        out = ActiveWindowExclusion::kWindowId;
        return true;
    }
    if (name == "legacy_partition_count") {
        out = ActiveWindowExclusion::kLegacyPartitionCount;
        return true;
    }
    return false;
}

const char* ActiveWindowExclusionName(ActiveWindowExclusion mode) {
    switch (mode) {
        case ActiveWindowExclusion::kWindowId:
            return "window_id";
        case ActiveWindowExclusion::kLegacyPartitionCount:
            return "legacy_partition_count";
    }
    return "unknown";
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

ActiveWindowExclusion Configuration::getActiveWindowExclusion() const {
    ActiveWindowExclusion mode = ActiveWindowExclusion::kWindowId;
    ParseActiveWindowExclusion(config_.checker.active_window_exclusion.get(), mode);
    return mode;
}

void Configuration::parseRoot(const void* yaml_root) {
    const YAML::Node& yaml = *static_cast<const YAML::Node*>(yaml_root);
    if (!yaml["completeness"]) {
        LOG(WARNING) << "Configuration has no 'completeness' section, keeping defaults";
        return;
    }
    auto root = yaml["completeness"];

    // Checker
    if (root["checker"]) {
        auto checker = root["checker"];
        if (checker["max_num_windows"]) config_.checker.max_num_windows.set(checker["max_num_windows"].as<int>());
        if (checker["active_window_exclusion"]) {
            config_.checker.active_window_exclusion.set(checker["active_window_exclusion"].as<std::string>());
        }
    }

    // Monitor
    if (root["monitor"]) {
        auto monitor = root["monitor"];
        if (monitor["window_ms"]) config_.monitor.window_ms.set(monitor["window_ms"].as<int64_t>());
        if (monitor["min_monitored_partitions_percentage"]) {
            config_.monitor.min_monitored_partitions_percentage.set(
                monitor["min_monitored_partitions_percentage"].as<double>());
        }
        if (monitor["num_windows_to_retain"]) {
            config_.monitor.num_windows_to_retain.set(monitor["num_windows_to_retain"].as<int>());
        }
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        parseRoot(&yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        parseRoot(&yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::overrideFromCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"max-num-windows", required_argument, 0, 'w'},
        {"window-ms", required_argument, 0, 'm'},
        {"min-pct", required_argument, 0, 'p'},
        {"retain", required_argument, 0, 'r'},
        {"exclusion", required_argument, 0, 'x'},
        {"config", required_argument, 0, 'f'},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    // Unknown options belong to the application's own parser
    opterr = 0;
    optind = 1;

    while ((c = getopt_long(argc, argv, "w:m:p:r:x:f:", long_options, &option_index)) != -1) {
        try {
            switch (c) {
                case 'w':
                    config_.checker.max_num_windows.set(std::stoi(optarg));
                    break;
                case 'm':
                    config_.monitor.window_ms.set(static_cast<int64_t>(std::stoll(optarg)));
                    break;
                case 'p':
                    config_.monitor.min_monitored_partitions_percentage.set(std::stod(optarg));
                    break;
                case 'r':
                    config_.monitor.num_windows_to_retain.set(std::stoi(optarg));
                    break;
                case 'x':
                    config_.checker.active_window_exclusion.set(optarg);
                    break;
                case 'f':
                    if (!loadFromFile(optarg)) {
                        LOG(ERROR) << "Ignoring invalid configuration file " << optarg;
                    }
                    break;
                default:
                    break;
            }
        } catch (const std::exception& e) {
            LOG(WARNING) << "Ignoring malformed command line value '" << (optarg ? optarg : "")
                << "': " << e.what();
        }
    }
    optind = 1;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.checker.max_num_windows.get() < 1) {
        validation_errors_.push_back("Max number of windows must be at least 1");
    }

    ActiveWindowExclusion mode;
    if (!ParseActiveWindowExclusion(config_.checker.active_window_exclusion.get(), mode)) {
        validation_errors_.push_back("Active window exclusion must be 'window_id' or 'legacy_partition_count'");
    }

    if (config_.monitor.window_ms.get() < 1) {
        validation_errors_.push_back("Window size must be at least 1 ms");
    }

    double pct = config_.monitor.min_monitored_partitions_percentage.get();
    if (pct < 0.0 || pct > 1.0) {
        validation_errors_.push_back("Minimum monitored partitions percentage must be between 0 and 1");
    }

    if (config_.monitor.num_windows_to_retain.get() < 1) {
        validation_errors_.push_back("Number of windows to retain must be at least 1");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Completeness
