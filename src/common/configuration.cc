#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Recpool {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
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
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        if (env_val[0] == '-') {
            LOG(WARNING) << "Negative value for unsigned env var " << env_var_ << ": " << env_val;
            return std::nullopt;
        }
        try {
            return std::stoull(env_val);
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

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml, RecpoolConfig& config) {
    if (!yaml["recpool"]) {
        LOG(WARNING) << "Configuration has no top-level 'recpool' key, nothing applied";
        return;
    }
    auto root = yaml["recpool"];

    if (root["pool"]) {
        auto pool = root["pool"];
        if (pool["capacity"]) config.pool.capacity.set(pool["capacity"].as<size_t>());
    }

    if (root["arena"]) {
        auto arena = root["arena"];
        if (arena["buffer_size"]) config.arena.buffer_size.set(arena["buffer_size"].as<size_t>());
        if (arena["range_capacity"]) config.arena.range_capacity.set(arena["range_capacity"].as<size_t>());
    }

    if (root["logging"]) {
        auto logging = root["logging"];
        if (logging["verbosity"]) config.logging.verbosity.set(logging["verbosity"].as<int>());
        if (logging["to_stderr"]) config.logging.to_stderr.set(logging["to_stderr"].as<bool>());
    }

    if (root["simulation"]) {
        auto simulation = root["simulation"];
        if (simulation["steps"]) config.simulation.steps.set(simulation["steps"].as<size_t>());
        if (simulation["records_per_step"]) config.simulation.records_per_step.set(simulation["records_per_step"].as<size_t>());
        if (simulation["mode"]) config.simulation.mode.set(simulation["mode"].as<std::string>());
    }
}

bool Configuration::commit(const RecpoolConfig& candidate) {
    validation_errors_ = collectErrors(candidate);
    if (!validation_errors_.empty()) {
        for (const auto& e : validation_errors_) {
            LOG(ERROR) << "Invalid configuration: " << e;
        }
        return false;
    }
    config_ = candidate;
    return true;
}

bool Configuration::loadFromFile(const std::string& filename) {
    RecpoolConfig candidate = config_;
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml, candidate);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        validation_errors_ = {std::string("Failed to parse ") + filename + ": " + e.what()};
        return false;
    }
    return commit(candidate);
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    RecpoolConfig candidate = config_;
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml, candidate);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        validation_errors_ = {std::string("Failed to parse configuration: ") + e.what()};
        return false;
    }
    return commit(candidate);
}

std::vector<std::string> Configuration::collectErrors(const RecpoolConfig& config) {
    std::vector<std::string> errors;

    if (config.arena.buffer_size.get() < 1) {
        errors.push_back("Arena buffer size must be at least 1");
    }

    if (config.simulation.records_per_step.get() < 1) {
        errors.push_back("Simulation records per step must be at least 1");
    }

    const std::string mode = config.simulation.mode.get();
    if (mode != "append" && mode != "double") {
        errors.push_back("Simulation mode must be 'append' or 'double', got '" + mode + "'");
    }

    if (config.logging.verbosity.get() < 0) {
        errors.push_back("Log verbosity cannot be negative");
    }

    return errors;
}

bool Configuration::validate() const {
    validation_errors_ = collectErrors(config_);
    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Recpool
