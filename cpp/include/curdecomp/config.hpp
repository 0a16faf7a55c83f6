#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>

#include "curdecomp/logging.hpp"

namespace curdecomp {

/**
 * Process-wide defaults for the CLI and for callers that want them.
 *
 * Sources, later ones win:
 *   1. built-in defaults
 *   2. CUR_* environment variables
 *   3. key = value lines of an optional config file
 */
class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();

        load_from_env();

        if (!config_file.empty()) {
            if (std::filesystem::exists(config_file)) {
                load_from_file(config_file);
            } else {
                LOG_WARN("Config file not found: ", config_file);
            }
        }

        return validate();
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_unlocked<T>(key, default_value);
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    template<typename T>
    T get_unlocked(const std::string& key, T default_value) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else if constexpr (std::is_integral_v<T>) {
                return static_cast<T>(std::stoll(it->second));
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    void load_from_env() {
        set_if_env("log.level", "CUR_LOG_LEVEL", "warn");
        set_if_env("log.file", "CUR_LOG_FILE", "");

        set_if_env("selection.method", "CUR_SELECTION_METHOD", "svd");
        set_if_env("selection.rank", "CUR_SELECTION_RANK", "1");
        set_if_env("selection.regularization", "CUR_REGULARIZATION", "1e-6");

        set_if_env("cur.symmetry_tolerance", "CUR_SYMMETRY_TOLERANCE", "1e-4");
        set_if_env("projector.threshold", "CUR_PROJECTOR_THRESHOLD", "1e-12");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else {
            values_[key] = default_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        auto trim = [](std::string& s) {
            s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); }));
            s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base(), s.end());
        };

        std::string line;
        while (std::getline(file, line)) {
            trim(line);
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) {
                LOG_WARN("Ignoring config line without '=': ", line);
                continue;
            }

            std::string key = line.substr(0, equals_pos);
            std::string value = line.substr(equals_pos + 1);
            trim(key);
            trim(value);

            if (!key.empty()) {
                values_[key] = value;
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    bool validate() {
        bool valid = true;

        LogLevel level;
        std::string log_level = get_unlocked<std::string>("log.level", "warn");
        if (!parse_log_level(log_level, level)) {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'warn'");
            values_["log.level"] = "warn";
        }

        std::string method = get_unlocked<std::string>("selection.method", "svd");
        if (method != "svd" && method != "pcovr") {
            LOG_ERROR("Unknown selection method: ", method);
            valid = false;
        }

        if (get_unlocked<long long>("selection.rank", 1) < 1) {
            LOG_ERROR("Selection rank must be at least 1");
            valid = false;
        }

        if (get_unlocked<double>("selection.regularization", 1e-6) <= 0.0) {
            LOG_ERROR("Regularization must be positive");
            valid = false;
        }

        if (get_unlocked<double>("cur.symmetry_tolerance", 1e-4) < 0.0) {
            LOG_ERROR("Symmetry tolerance must be non-negative");
            valid = false;
        }

        if (get_unlocked<double>("projector.threshold", 1e-12) < 0.0) {
            LOG_ERROR("Projector threshold must be non-negative");
            valid = false;
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Initialize configuration and apply its logging settings
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    LogLevel level = LogLevel::WARN;
    if (parse_log_level(config.get<std::string>("log.level"), level)) {
        set_log_level(level);
    }

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream;
        if (log_stream.is_open()) log_stream.close();
        log_stream.open(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_INFO("Configuration loaded successfully");
    return true;
}

} // namespace curdecomp
