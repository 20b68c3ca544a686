#ifndef RECPOOL_COMMON_CONFIGURATION_H_
#define RECPOOL_COMMON_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace YAML {
class Node;
}

namespace Recpool {

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

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct RecpoolConfig {
    // ObjectPool / DoubleBuffer sizing
    struct Pool {
        ConfigValue<size_t> capacity{8, "RECPOOL_POOL_CAPACITY"};
    } pool;

    // FlatObjectPool / RecordSequence sizing
    struct Arena {
        ConfigValue<size_t> buffer_size{1000, "RECPOOL_ARENA_BUFFER_SIZE"};
        ConfigValue<size_t> range_capacity{10, "RECPOOL_ARENA_RANGE_CAPACITY"};
    } arena;

    struct Logging {
        // glog FLAGS_v
        ConfigValue<int> verbosity{0, "RECPOOL_LOG_VERBOSITY"};
        ConfigValue<bool> to_stderr{true, "RECPOOL_LOG_TO_STDERR"};
    } logging;

    // Parameters of the CLI "simulate" command
    struct Simulation {
        ConfigValue<size_t> steps{5, "RECPOOL_SIM_STEPS"};
        ConfigValue<size_t> records_per_step{3, "RECPOOL_SIM_RECORDS_PER_STEP"};
        // Supported modes: append (RecordSequence), double (DoubleBuffer)
        ConfigValue<std::string> mode{"append", "RECPOOL_SIM_MODE"};
    } simulation;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file. On any parse, conversion or validation
    // failure the current configuration is left as it was.
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string, same rules as loadFromFile
    bool loadFromString(const std::string& yaml_content);

    // Drop everything loaded so far (environment overrides still apply)
    void resetToDefaults() { config_ = RecpoolConfig(); }

    // Get the configuration
    const RecpoolConfig& config() const { return config_; }
    RecpoolConfig& config() { return config_; }

    // Helper methods for common access patterns
    size_t getPoolCapacity() const { return config_.pool.capacity.get(); }
    size_t getArenaBufferSize() const { return config_.arena.buffer_size.get(); }
    size_t getArenaRangeCapacity() const { return config_.arena.range_capacity.get(); }
    int getLogVerbosity() const { return config_.logging.verbosity.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    RecpoolConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Helper methods for parsing
    static void applyYAML(const YAML::Node& yaml, RecpoolConfig& config);
    static std::vector<std::string> collectErrors(const RecpoolConfig& config);
    bool commit(const RecpoolConfig& candidate);
};

// Global accessor
const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Recpool

#endif // RECPOOL_COMMON_CONFIGURATION_H_
