/*
 * debug.cpp - Channel-based diagnostic logging for OpusWire
 * This file is part of OpusWire.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OpusWire is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "opuswire.h"

std::ofstream Debug::m_logfile;
std::mutex Debug::m_mutex;
std::unordered_set<std::string> Debug::m_enabled_channels;

namespace {

// HH:MM:SS.uuuuuu in local time
std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;
    std::time_t timer = std::chrono::system_clock::to_time_t(now);

    std::tm local {};
#ifdef _WIN32
    localtime_s(&local, &timer);
#else
    localtime_r(&timer, &local);
#endif

    std::ostringstream ss;
    ss << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(6) << us.count();
    return ss.str();
}

} // anonymous namespace

void Debug::init(const std::string& logfile, const std::vector<std::string>& channels) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!logfile.empty()) {
        if (m_logfile.is_open()) {
            m_logfile.close();
        }
        m_logfile.open(logfile, std::ios::out | std::ios::app);
        if (!m_logfile.is_open()) {
            std::cerr << "Debug: Failed to open log file: " << logfile << std::endl;
        }
    }
    m_enabled_channels.insert(channels.begin(), channels.end());
}

void Debug::shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logfile.is_open()) {
        m_logfile.close();
    }
    m_enabled_channels.clear();
}

bool Debug::isChannelEnabled(const std::string& channel) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_enabled_channels.count(DebugChannel::kAll) > 0 || m_enabled_channels.count(channel) > 0;
}

void Debug::write(const std::string& channel, const std::string& function, int line,
                  const std::string& message) {
    std::ostringstream ss;
    ss << timestamp() << " [" << channel << "]";
    if (!function.empty()) {
        ss << " " << function << ":" << line;
    }
    ss << ": " << message << '\n';
    const std::string text = ss.str();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logfile.is_open()) {
        m_logfile << text;
        m_logfile.flush();
    } else {
        std::cout << text;
        std::cout.flush();
    }
}
