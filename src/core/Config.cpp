/*
 * Config.cpp - OpusWire configuration file
 * This file is part of OpusWire.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OpusWire is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "opuswire.h"

namespace OpusWire {
namespace Core {

namespace {

std::string trim(const std::string& s) {
    const char* whitespace = " \t\r\n";
    size_t start = s.find_first_not_of(whitespace);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}

bool parsePositiveInt(const std::string& value, int& out) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size() || parsed <= 0) return false;
        out = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::vector<std::string> splitChannels(const std::string& value) {
    std::vector<std::string> channels;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) channels.push_back(item);
    }
    return channels;
}

} // anonymous namespace

Config Config::fromFile(const std::string& path) {
    Config config;

    std::ifstream file(path);
    if (!file.is_open()) {
        Debug::log(DebugChannel::kConfig, "Config: No configuration at ", path, ", using defaults");
        return config;
    }

    std::string line;
    while (std::getline(file, line)) {
        config.applyLine(line);
    }
    return config;
}

bool Config::applyLine(const std::string& raw_line) {
    std::string line = trim(raw_line);
    if (line.empty() || line[0] == '#') return false;

    size_t equals = line.find('=');
    if (equals == std::string::npos) return false;

    std::string key = trim(line.substr(0, equals));
    std::string value = trim(line.substr(equals + 1));

    if (key == "library") {
        library = value;
    } else if (key == "rate") {
        if (!parsePositiveInt(value, sampling_rate)) {
            Debug::log(DebugChannel::kConfig, "Config: Ignoring invalid rate '", value, "'");
            return false;
        }
    } else if (key == "channels") {
        if (!parsePositiveInt(value, channels)) {
            Debug::log(DebugChannel::kConfig, "Config: Ignoring invalid channels '", value, "'");
            return false;
        }
    } else if (key == "application") {
        auto parsed = parseApplication(value);
        if (!parsed) {
            Debug::log(DebugChannel::kConfig, "Config: Ignoring unknown application '", value, "'");
            return false;
        }
        application = *parsed;
    } else if (key == "log_file") {
        log_file = value;
    } else if (key == "debug") {
        debug_channels = splitChannels(value);
    } else {
        return false;
    }
    return true;
}

void Config::applyEnvironment() {
    const char* override_name = getenv(OPUSWIRE_LIBRARY_ENV);
    if (override_name && strlen(override_name) > 0) {
        library = override_name;
    }
}

std::string Config::getStoragePath() {
#ifdef _WIN32
    const char* appdata = getenv("APPDATA");
    return std::string(appdata ? appdata : ".") + "\\OpusWire";
#else
    // Use XDG config directory for unified storage
    const char* xdg_config = getenv("XDG_CONFIG_HOME");
    if (xdg_config && strlen(xdg_config) > 0) {
        return std::string(xdg_config) + "/opuswire";
    }
    const char* home = getenv("HOME");
    return std::string(home ? home : ".") + "/.config/opuswire";
#endif
}

std::string Config::defaultPath() {
    return getStoragePath() + "/opuswire.conf";
}

} // namespace Core
} // namespace OpusWire
