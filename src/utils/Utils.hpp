#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "../config/AppConfig.hpp"

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static std::optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (std::string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Parses key=value command-line arguments. Returns nullopt if any argument is malformed.
    static std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
        std::map<std::string, std::string> argMap;
        for (const std::string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) { // Ensure key is not empty
                argMap[arg.substr(0, delimiterPos)] = arg.substr(delimiterPos + 1);
            } else {
                std::cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << std::endl;
                return std::nullopt;
            }
        }
        return argMap;
    }

    // Applies one setting. Unknown keys and unparsable values print a warning
    // and leave the config unchanged. Returns true if the value was applied.
    static bool applySetting(AppConfig& config, const std::string& key, const std::string& value) {
        if (key == "cache_capacity") {
            return applyInt(key, value, config.cache_capacity);
        } else if (key == "default_ttl_in_millis") {
            return applyInt(key, value, config.default_ttl_in_millis);
        } else if (key == "sweep_interval_in_millis") {
            auto val = stringToInt(value);
            if (!val || *val < 0) {
                std::cerr << "Warning: Invalid integer for sweep_interval_in_millis: " << value << std::endl;
                return false;
            }
            // 0 disables the sweeper
            config.sweep_interval_in_millis = (*val == 0) ? std::nullopt : std::optional<int>(*val);
            return true;
        } else if (key == "coalesce_loads") {
            return applyFlag(key, value, config.coalesce_loads);
        } else if (key == "use_redis") {
            return applyFlag(key, value, config.use_redis);
        } else if (key == "redis_host") {
            config.redis_host = value;
            return true;
        } else if (key == "redis_port") {
            return applyInt(key, value, config.redis_port);
        } else if (key == "store_latency_in_millis") {
            return applyInt(key, value, config.store_latency_in_millis);
        } else if (key == "demo_worker_threads") {
            return applyInt(key, value, config.demo_worker_threads);
        } else if (key == "metrics_batch_size") {
            return applyInt(key, value, config.metrics_batch_size);
        } else if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
                return true;
            } catch (const std::invalid_argument& e) {
                std::cerr << "Warning: " << e.what() << std::endl;
                return false;
            }
        }
        std::cerr << "Warning: Unknown configuration key: " << key << std::endl;
        return false;
    }

    // Reads key = value lines; '#' starts a comment line.
    static void loadConfigurationFile(std::istream& in, AppConfig& config) {
        std::string line;
        while (std::getline(in, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                continue;
            }
            size_t delimiterPos = line.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) {
                applySetting(config, trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)));
            } else {
                std::cerr << "Warning: Ignoring malformed configuration line: " << line << std::endl;
            }
        }
    }

    // Defaults, then the first config file found, then command-line arguments.
    static AppConfig loadConfiguration(const std::map<std::string, std::string>& startupArguments) {
        AppConfig config;

        std::vector<std::string> config_paths = {
            Constants::CONFIG_FILE_NAME,                        // Current directory
            std::string("../") + Constants::CONFIG_FILE_NAME,   // Parent directory
            std::string("/etc/cacheaside/") + Constants::CONFIG_FILE_NAME
        };

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                std::cout << "Reading configuration from " << config_path << "..." << std::endl;
                loadConfigurationFile(configFile, config);
                config_found = true;
                break;
            }
        }
        if (!config_found) {
            std::cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << std::endl;
        }

        for (const auto& pair : startupArguments) {
            applySetting(config, pair.first, pair.second);
        }
        return config;
    }

    // Printable form of a cache key for log lines.
    template <typename Key>
    static std::string describeKey(const Key& key) {
        if constexpr (std::is_convertible_v<const Key&, std::string>) {
            return std::string(key);
        } else if constexpr (std::is_arithmetic_v<Key>) {
            return std::to_string(key);
        } else {
            return "<opaque key>";
        }
    }

private:
    static bool applyInt(const std::string& key, const std::string& value, int& target) {
        if (auto val = stringToInt(value)) {
            target = *val;
            return true;
        }
        std::cerr << "Warning: Invalid integer for " << key << ": " << value << std::endl;
        return false;
    }

    static bool applyFlag(const std::string& key, const std::string& value, bool& target) {
        if (auto val = stringToInt(value); val && (*val == 0 || *val == 1)) {
            target = (*val == 1);
            return true;
        }
        std::cerr << "Warning: Expected 0 or 1 for " << key << ": " << value << std::endl;
        return false;
    }
};

#endif // UTILS_HPP
