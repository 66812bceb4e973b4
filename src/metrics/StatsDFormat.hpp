#pragma once

#include <chrono>
#include <sstream>
#include <string>

// StatsD wire lines: <key>:<value>|<type>
namespace StatsDFormat {
    inline std::string counter(const std::string& key, int value) {
        std::stringstream ss;
        ss << key << ":" << value << "|c";
        return ss.str();
    }

    inline std::string gauge(const std::string& key, double value) {
        std::stringstream ss;
        ss << key << ":" << value << "|g";
        return ss.str();
    }

    inline std::string timing(const std::string& key, std::chrono::milliseconds value) {
        std::stringstream ss;
        ss << key << ":" << value.count() << "|ms";
        return ss.str();
    }
}
