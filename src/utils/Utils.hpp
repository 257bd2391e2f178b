#ifndef UTILS_HPP
#define UTILS_HPP

#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
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

    static OverwritePolicy stringToOverwritePolicy(const std::string& policy) {
        if (policy == "replace") return OverwritePolicy::AlwaysReplace;
        if (policy == "keep_longest") return OverwritePolicy::KeepLongest;
        throw std::invalid_argument("Invalid overwrite policy: " + policy);
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

    // Parses key=value command-line arguments. nullopt if any is malformed.
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

    // Applies one configuration entry. Unknown keys are ignored and bad
    // integers keep the current value; both return false.
    // Throws std::invalid_argument for an unknown log level or overwrite policy.
    static bool applyConfigValue(AppConfig& config, const std::string& key, const std::string& value) {
        if (key == "log_level") {
            config.log_level = stringToLogLevel(value);
            return true;
        }
        if (key == "overwrite_policy") {
            config.overwrite_policy = stringToOverwritePolicy(value);
            return true;
        }
        if (key == "backend_host") {
            config.backend_host = value;
            return true;
        }
        if (key == "cache_capacity" && (value == "unbounded" || value == "-1")) {
            config.cache_capacity = -1;
            return true;
        }

        int* target = nullptr;
        if (key == "cache_capacity") {
            target = &config.cache_capacity;
        } else if (key == "expiry_granularity_ms") {
            target = &config.expiry_granularity_ms;
        } else if (key == "backend_port") {
            target = &config.backend_port;
        } else if (key == "request_timeout_ms") {
            target = &config.request_timeout_ms;
        } else if (key == "server_threads") {
            target = &config.server_threads;
        } else if (key == "square_base_ttl_ms") {
            target = &config.square_base_ttl_ms;
        } else if (key == "square_min_delay_ms") {
            target = &config.square_min_delay_ms;
        } else if (key == "square_max_delay_ms") {
            target = &config.square_max_delay_ms;
        } else if (key == "square_error_one_in") {
            target = &config.square_error_one_in;
        } else {
            return false;
        }

        auto val = stringToInt(value);
        if (!val || *val < 0) {
            std::cerr << "Warning: Invalid integer for " << key << ": " << value << std::endl;
            return false;
        }
        *target = *val;
        return true;
    }

    // Reads "key = value" lines; blank lines and lines starting with '#' are skipped.
    static void loadConfigurationStream(std::istream& in, AppConfig& config) {
        std::string line;
        while (std::getline(in, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            size_t delimiterPos = line.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) {
                applyConfigValue(config, trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)));
            }
        }
    }

    // Defaults, then the config file (config=<path>, or ttlcache.config in the
    // current or parent directory), then the remaining command-line arguments.
    static AppConfig loadConfiguration(const std::map<std::string, std::string>& startupArguments) {
        AppConfig config;

        std::vector<std::string> config_paths;
        auto explicit_it = startupArguments.find("config");
        if (explicit_it != startupArguments.end()) {
            config_paths.push_back(explicit_it->second);
        } else {
            config_paths.push_back(Constants::CONFIG_FILE_NAME);
            config_paths.push_back(std::string("../") + Constants::CONFIG_FILE_NAME);
        }

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                std::cout << "Reading configuration from " << config_path << "..." << std::endl;
                loadConfigurationStream(configFile, config);
                config_found = true;
                break;
            }
        }
        if (!config_found) {
            std::cerr << "Warning: Configuration file not found. Using defaults and command-line arguments." << std::endl;
        }

        for (const auto& [key, value] : startupArguments) {
            applyConfigValue(config, key, value);
        }
        return config;
    }
};

#endif // UTILS_HPP
