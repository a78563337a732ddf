/*
 * debug.h - Channel-based diagnostic logging for OpusWire
 * This file is part of OpusWire.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OpusWire is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef DEBUG_H
#define DEBUG_H

// No direct includes - all includes should be in opuswire.h

// Channels written by the library and the command-line encoder
namespace DebugChannel {
inline constexpr char kNative[] = "native";   ///< library loading, symbol binding
inline constexpr char kOpus[] = "opus";       ///< encoder lifecycle, codec errors
inline constexpr char kConfig[] = "config";   ///< configuration parsing
inline constexpr char kEnc[] = "enc";         ///< opuswire-enc
inline constexpr char kAll[] = "all";         ///< enables every channel
} // namespace DebugChannel

/**
 * @brief Process-wide diagnostic log
 *
 * Nothing is written until init() enables at least one channel. Lines go to
 * the log file given to init(), or to stdout when there is none. Every
 * member is safe to call from any thread, including init() and shutdown()
 * while other threads are logging.
 */
class Debug {
public:
    /**
     * @brief Enable channels and optionally open a log file
     * @param logfile File to append to; empty for stdout
     * @param channels Channel names to add to the enabled set
     */
    static void init(const std::string& logfile, const std::vector<std::string>& channels);

    // Close the log file and disable every channel
    static void shutdown();

    static bool isChannelEnabled(const std::string& channel);

    template<typename... Args>
    static void log(const std::string& channel, Args&&... args) {
        if (isChannelEnabled(channel)) {
            write(channel, "", 0, format(std::forward<Args>(args)...));
        }
    }

    // Same as log(), prefixed with the calling function and line. Use DEBUG_LOG.
    template<typename... Args>
    static void logAt(const std::string& channel, const char* function, int line, Args&&... args) {
        if (isChannelEnabled(channel)) {
            write(channel, function, line, format(std::forward<Args>(args)...));
        }
    }

private:
    template<typename... Args>
    static std::string format(Args&&... args) {
        std::ostringstream ss;
        if constexpr (sizeof...(args) > 0) {
            (ss << ... << args);
        }
        return ss.str();
    }

    static void write(const std::string& channel, const std::string& function, int line,
                      const std::string& message);

    static std::ofstream m_logfile;
    static std::mutex m_mutex;
    static std::unordered_set<std::string> m_enabled_channels;
};

#define DEBUG_LOG(channel, ...) Debug::logAt(channel, __FUNCTION__, __LINE__, __VA_ARGS__)

#endif // DEBUG_H
