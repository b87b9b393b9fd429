#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>

#include "tokvec/logging.hpp"

namespace tokvec {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        load_from_env();

        if (!config_file.empty()) {
            if (!std::filesystem::exists(config_file)) {
                LOG_WARN("Config file not found: ", config_file);
            } else {
                load_from_file(config_file);
            }
        }

        return validate();
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end() || it->second.empty()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, std::size_t>) {
                return static_cast<std::size_t>(std::stoull(it->second));
            } else if constexpr (std::is_same_v<T, std::uint64_t>) {
                return static_cast<std::uint64_t>(std::stoull(it->second));
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

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) > 0;
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

private:
    Config() = default;

    void load_from_env() {
        // Logging
        set_if_env("log.level", "TOKVEC_LOG_LEVEL", "info");
        set_if_env("log.file", "TOKVEC_LOG_FILE", "");

        // Performance
        set_if_env("perf.max_threads", "TOKVEC_MAX_THREADS", "0");  // 0 = auto-detect

        // Vocabulary construction
        set_if_env("voc.lang", "TOKVEC_LANG", "es");
        set_if_env("voc.size_exponent", "TOKVEC_VOC_SIZE_EXPONENT", "13");
        set_if_env("voc.prefix_suffix", "TOKVEC_PREFIX_SUFFIX", "true");
        set_if_env("voc.limit", "TOKVEC_LIMIT", "0");
        set_if_env("voc.symbols", "TOKVEC_SYMBOLS", "");

        // Per-token classifier training
        set_if_env("train.min_pos", "TOKVEC_MIN_POS", "512");
        set_if_env("train.max_pos", "TOKVEC_MAX_POS", "8192");
        set_if_env("train.negative_cap", "TOKVEC_NEGATIVE_CAP", "1024");
        set_if_env("train.precision", "TOKVEC_PRECISION", "float32");
        set_if_env("train.intercept", "TOKVEC_INTERCEPT", "false");
        set_if_env("train.seed", "TOKVEC_SEED", "0");

        // Encoder
        set_if_env("encode.merge_idf", "TOKVEC_MERGE_IDF", "true");
        set_if_env("encode.force_token", "TOKVEC_FORCE_TOKEN", "true");
        set_if_env("encode.kfold", "TOKVEC_KFOLD", "5");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else if (!values_.count(key)) {
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
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) continue;

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

    // Called with mutex_ held
    bool validate() {
        bool valid = true;

        auto lookup = [this](const std::string& key) {
            auto it = values_.find(key);
            return it == values_.end() ? std::string() : it->second;
        };

        try {
            int exponent = std::stoi(lookup("voc.size_exponent"));
            if (exponent <= 0 || exponent > 30) {
                LOG_ERROR("Invalid vocabulary size exponent: ", exponent);
                valid = false;
            }
        } catch (const std::exception&) {
            LOG_ERROR("Vocabulary size exponent is not a number: ", lookup("voc.size_exponent"));
            valid = false;
        }

        std::string precision = lookup("train.precision");
        if (precision != "float16" && precision != "float32" && precision != "float64") {
            LOG_ERROR("Unknown precision '", precision, "'");
            valid = false;
        }

        std::string log_level = lookup("log.level");
        if (log_level != "debug" && log_level != "info" && log_level != "warn" &&
            log_level != "error" && log_level != "fatal") {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            values_["log.level"] = "info";
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Initialize configuration and logging on startup
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();

    if (const char* log_level_env = std::getenv("TOKVEC_LOG_LEVEL")) {
        set_log_level(parse_log_level(log_level_env));
    }

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    set_log_level(parse_log_level(config.get<std::string>("log.level", "info")));

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty() && !set_log_file(log_file)) {
        LOG_ERROR("Could not open log file: ", log_file);
    }

    LOG_DEBUG("Configuration loaded");
    return true;
}

} // namespace tokvec
