#ifndef UTILS_HPP
#define UTILS_HPP

#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/CacheConfig.hpp"

using namespace std;

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
    static optional<int> stringToInt(const std::string& str) {
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

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Parses key=value command-line arguments; nullopt if any argument is malformed.
    static optional<map<string, string>> parseArguments(const vector<string>& args) {
        map<string, string> argMap;
        for (const string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) { // Ensure key is not empty
                string key = arg.substr(0, delimiterPos);
                string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << endl;
                return nullopt;
            }
        }
        return argMap;
    }

    static vector<string> defaultConfigPaths() {
        return {
            Constants::CONFIG_FILE_NAME,              // Current directory
            string("../") + Constants::CONFIG_FILE_NAME,
            string("/etc/memocache/") + Constants::CONFIG_FILE_NAME
        };
    }

    // Applies one setting. Unknown keys are ignored; invalid values keep the
    // current value and print a warning. Returns true if the key was recognized.
    static bool applySetting(CacheConfig& config, const string& key, const string& value, const string& source) {
        if (key == "max_size") {
            auto val = stringToInt(value);
            if (val && *val > 0) {
                config.max_size = *val;
            } else {
                cerr << "Warning: Invalid max_size in " << source << ": '" << value << "'. Expected a positive integer." << endl;
            }
        } else if (key == "ttl_ms") {
            auto val = stringToInt(value);
            if (val && *val >= 0) {
                config.ttl_in_millis = *val;
            } else {
                cerr << "Warning: Invalid ttl_ms in " << source << ": '" << value << "'. Expected a non-negative integer." << endl;
            }
        } else if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
            } catch (const std::invalid_argument& e) {
                cerr << "Warning: " << e.what() << " in " << source << endl;
            }
        } else if (key == "io_threads") {
            auto val = stringToInt(value);
            if (val && *val > 0) {
                config.num_io_threads = *val;
            } else {
                cerr << "Warning: Invalid io_threads in " << source << ": '" << value << "'. Expected a positive integer." << endl;
            }
        } else if (key == "metrics") {
            auto val = stringToInt(value);
            if (val && (*val == 0 || *val == 1)) {
                config.emit_metrics = (*val == 1);
            } else {
                cerr << "Warning: Invalid metrics flag in " << source << ": '" << value << "'. Expected 0 or 1." << endl;
            }
        } else if (key == "metrics_batch_size") {
            auto val = stringToInt(value);
            if (val && *val >= 0) {
                config.metrics_batch_size = *val;
            } else {
                cerr << "Warning: Invalid metrics_batch_size in " << source << ": '" << value << "'. Expected a non-negative integer." << endl;
            }
        } else if (key == "metrics_send_interval") {
            auto val = stringToInt(value);
            if (val && *val >= 0) {
                config.metrics_send_interval_in_millis = *val;
            } else {
                cerr << "Warning: Invalid metrics_send_interval in " << source << ": '" << value << "'. Expected a non-negative integer." << endl;
            }
        } else {
            return false;
        }
        return true;
    }

    // Reads the first config file found, then applies command-line overrides.
    static CacheConfig loadConfiguration(const map<string, string>& startupArguments,
                                         const vector<string>& config_paths = defaultConfigPaths()) {
        CacheConfig config;

        // --- Load from Config File ---
        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (!configFile.is_open()) {
                continue;
            }
            cout << "Reading configuration from " << config_path << "..." << endl;
            config_found = true;
            std::string line;
            while (getline(configFile, line)) {
                line = trim(line);
                if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                    continue;
                }
                size_t delimiterPos = line.find('=');
                if (delimiterPos != string::npos && delimiterPos > 0) {
                    string key = trim(line.substr(0, delimiterPos));
                    string value = trim(line.substr(delimiterPos + 1));
                    if (!applySetting(config, key, value, config_path)) {
                        cerr << "Warning: Unknown key '" << key << "' in " << config_path << endl;
                    }
                }
            }
            break;
        }

        if (!config_found) {
            cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << endl;
        }

        // --- Command-line overrides ---
        for (const auto& [key, value] : startupArguments) {
            if (!applySetting(config, key, value, "command line")) {
                cerr << "Warning: Ignoring unknown argument '" << key << "'" << endl;
            }
        }

        return config;
    }
};

#endif // UTILS_HPP
