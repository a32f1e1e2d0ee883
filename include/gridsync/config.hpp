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

#include "gridsync/logging.hpp"

namespace gridsync {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from GS_* environment variables and an optional key=value file
    bool load(const std::string& config_file = "") {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            load_from_env();
            if (!config_file.empty() && std::filesystem::exists(config_file)) {
                load_from_file(config_file);
            }
        }
        return validate();
    }

    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return std::stoll(it->second);
            } else if constexpr (std::is_same_v<T, size_t>) {
                return static_cast<size_t>(std::stoull(it->second));
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(), ::tolower);
                return val == "true" || val == "1" || val == "yes" || val == "on";
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

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            if (key == "db.password") continue;
            LOG_INFO("  ", key, " = ", value);
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_from_env() {
        set_if_env("db.host", "GS_DB_HOST", "localhost");
        set_if_env("db.port", "GS_DB_PORT", "5432");
        set_if_env("db.user", "GS_DB_USER", "postgres");
        set_if_env("db.password", "GS_DB_PASS", "");
        set_if_env("db.name", "GS_DB_NAME", "gridsync");

        set_if_env("log.level", "GS_LOG_LEVEL", "info");
        set_if_env("log.file", "GS_LOG_FILE", "");

        // Bulk ingestion
        set_if_env("ingest.batch_size", "GS_INGEST_BATCH_SIZE", "35000");
        set_if_env("ingest.max_concurrency", "GS_INGEST_MAX_CONCURRENCY", "2");
        set_if_env("ingest.max_rows", "GS_INGEST_MAX_ROWS", "100000");
        set_if_env("ingest.index_drop_cell_threshold", "GS_INGEST_INDEX_DROP_CELLS", "1000000");

        // View synchronization
        set_if_env("sync.debounce_ms", "GS_SYNC_DEBOUNCE_MS", "400");
        set_if_env("sync.retry_base_ms", "GS_SYNC_RETRY_BASE_MS", "200");
        set_if_env("sync.retry_max_ms", "GS_SYNC_RETRY_MAX_MS", "5000");
        set_if_env("sync.max_retries", "GS_SYNC_MAX_RETRIES", "5");

        // Paginated reads
        set_if_env("page.first_size", "GS_PAGE_FIRST_SIZE", "500");
        set_if_env("page.max_size", "GS_PAGE_MAX_SIZE", "100000");
        set_if_env("page.read_retries", "GS_PAGE_READ_RETRIES", "3");
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

    bool validate() {
        bool valid = true;

        if (get<std::string>("db.host").empty()) {
            LOG_ERROR("Database host not configured");
            valid = false;
        }

        int port = get<int>("db.port");
        if (port <= 0 || port > 65535) {
            LOG_ERROR("Invalid database port: ", port);
            valid = false;
        }

        if (get<int>("ingest.batch_size") <= 0) {
            LOG_ERROR("ingest.batch_size must be positive");
            valid = false;
        }

        if (get<int>("ingest.max_concurrency") <= 0) {
            LOG_ERROR("ingest.max_concurrency must be positive");
            valid = false;
        }

        std::string log_level = get<std::string>("log.level");
        if (log_level != "debug" && log_level != "info" && log_level != "warn" &&
            log_level != "error" && log_level != "fatal") {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            set("log.level", "info");
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Initialize configuration on startup
inline bool init_config(const std::string& config_file = "gridsync.env") {
    Config& config = Config::getInstance();

    const char* log_level_env = std::getenv("GS_LOG_LEVEL");
    if (log_level_env) {
        set_log_level(parse_log_level(log_level_env));
    }

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    set_log_level(parse_log_level(config.get<std::string>("log.level")));

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_DEBUG("Configuration loaded");
    return true;
}

} // namespace gridsync
