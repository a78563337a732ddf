/*
 * Config.h - OpusWire configuration file
 * This file is part of OpusWire.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OpusWire is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef CONFIG_H
#define CONFIG_H

// No direct includes - all includes should be in opuswire.h

namespace OpusWire {
namespace Core {

/**
 * @brief Settings read from a key=value configuration file
 *
 * Lines starting with '#' and lines without '=' are ignored, as are unknown
 * keys. A value that does not parse is logged on the "config" channel and
 * the default is kept.
 */
struct Config {
    std::string library;                      ///< Explicit codec library; empty means discovery
    int sampling_rate = 48000;
    int channels = 2;
    CodecApplication application = CodecApplication::Audio;
    std::string log_file;
    std::vector<std::string> debug_channels;

    /**
     * @brief Read a configuration file
     * @param path File to read; a missing file yields the defaults
     */
    static Config fromFile(const std::string& path);

    /**
     * @brief Apply one key=value line
     * @return true if the line set a known key
     */
    bool applyLine(const std::string& line);

    /**
     * @brief Let OPUSWIRE_OPUS_LIBRARY override the library setting
     */
    void applyEnvironment();

    /**
     * @brief $XDG_CONFIG_HOME/opuswire, falling back to ~/.config/opuswire
     */
    static std::string getStoragePath();

    static std::string defaultPath();
};

} // namespace Core
} // namespace OpusWire

#endif // CONFIG_H
