/*
 * main.cpp - opuswire-enc, raw PCM to Opus packet encoder
 * This file is part of OpusWire.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OpusWire is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#include "opuswire.h"
#include <getopt.h>

using namespace OpusWire;
using namespace OpusWire::Codec::Opus;

namespace {

void print_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " [options] <input.pcm>" << std::endl;
    std::cerr << "Encodes raw signed 16-bit interleaved PCM into 20ms Opus packets." << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  -l, --library PATH       Codec library to load instead of discovery" << std::endl;
    std::cerr << "  -r, --rate HZ            Sampling rate (default 48000)" << std::endl;
    std::cerr << "  -c, --channels N         Channel count (default 2)" << std::endl;
    std::cerr << "  -a, --application NAME   audio, voip or lowdelay (default audio)" << std::endl;
    std::cerr << "  -C, --config FILE        Configuration file (default " << Core::Config::defaultPath() << ")" << std::endl;
    std::cerr << "  -v, --verbose            Print every packet and enable debug logging" << std::endl;
    std::cerr << "  -V, --version            Show version information" << std::endl;
    std::cerr << "  -h, --help               Show this help message" << std::endl;
}

void print_version() {
    std::cout << "opuswire-enc " << OPUSWIRE_VERSION << std::endl;
    std::cout << "Maintainer: " << OPUSWIRE_MAINTAINER << std::endl;
}

bool parse_int(const char* text, int& out) {
    char* end = nullptr;
    errno = 0;
    long value = strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || value <= 0 || value > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
    // Command-line values are collected first and applied over the
    // configuration file once its location is known.
    std::string config_path = Core::Config::defaultPath();
    std::optional<std::string> library;
    std::optional<int> rate;
    std::optional<int> channels;
    std::optional<CodecApplication> application;
    bool verbose = false;

    static const struct option long_options[] = {
        {"library", required_argument, 0, 'l'},
        {"rate", required_argument, 0, 'r'},
        {"channels", required_argument, 0, 'c'},
        {"application", required_argument, 0, 'a'},
        {"config", required_argument, 0, 'C'},
        {"verbose", no_argument, 0, 'v'},
        {"version", no_argument, 0, 'V'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "l:r:c:a:C:vVh", long_options, nullptr)) != -1) {
        int value = 0;
        switch (opt) {
            case 'l':
                library = optarg;
                break;
            case 'r':
                if (!parse_int(optarg, value)) {
                    std::cerr << "Error: Invalid sampling rate: " << optarg << std::endl;
                    return 1;
                }
                rate = value;
                break;
            case 'c':
                if (!parse_int(optarg, value)) {
                    std::cerr << "Error: Invalid channel count: " << optarg << std::endl;
                    return 1;
                }
                channels = value;
                break;
            case 'a':
                application = parseApplication(optarg);
                if (!application) {
                    std::cerr << "Error: Unknown application: " << optarg << std::endl;
                    return 1;
                }
                break;
            case 'C':
                config_path = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            case 'V':
                print_version();
                return 0;
            case 'h':
                print_usage(argv[0]);
                return 0;
            case '?': // Invalid option
                return 1; // getopt_long already prints an error message.
        }
    }

    if (optind != argc - 1) {
        std::cerr << "Error: Expected exactly one input file." << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    std::string input_path = argv[optind];

    Core::Config config = Core::Config::fromFile(config_path);
    config.applyEnvironment();
    if (library) config.library = *library;
    if (rate) config.sampling_rate = *rate;
    if (channels) config.channels = *channels;
    if (application) config.application = *application;
    if (verbose) config.debug_channels.push_back(DebugChannel::kAll);

    Debug::init(config.log_file, config.debug_channels);
    DEBUG_LOG(DebugChannel::kEnc, "Configuration from ", config_path, ": library='", config.library, "', rate=",
              config.sampling_rate, ", channels=", config.channels, ", application=", config.application);

    std::ifstream input(input_path, std::ios::binary);
    if (!input.is_open()) {
        std::cerr << "Error: Failed to open input file: " << input_path << std::endl;
        Debug::shutdown();
        return 1;
    }

    try {
        if (!config.library.empty()) {
            load(config.library);
        }
        if (!isLoaded()) {
            std::cerr << "Error: No Opus library found. Use --library or set "
                      << OPUSWIRE_LIBRARY_ENV << "." << std::endl;
            Debug::shutdown();
            return 1;
        }

        Encoder encoder(config.sampling_rate, config.channels, config.application);
        const FrameGeometry& geometry = encoder.geometry();

        std::cout << "Encoding " << input_path << " at " << config.sampling_rate << "Hz, "
                  << config.channels << " channel(s), " << config.application << " profile ("
                  << geometry << ")" << std::endl;

        std::vector<uint8_t> frame(static_cast<size_t>(geometry.frame_size_bytes));
        uint64_t frames = 0;
        uint64_t input_bytes = 0;
        uint64_t output_bytes = 0;

        while (input) {
            input.read(reinterpret_cast<char*>(frame.data()), static_cast<std::streamsize>(frame.size()));
            std::streamsize got = input.gcount();
            if (got <= 0) break;

            // Pad a short trailing frame with silence.
            if (static_cast<size_t>(got) < frame.size()) {
                Debug::log(DebugChannel::kEnc, "Padding final frame from ", got, " to ", frame.size(), " bytes");
                std::fill(frame.begin() + got, frame.end(), 0);
            }

            std::vector<uint8_t> packet = encoder.encode(frame);
            input_bytes += static_cast<uint64_t>(got);
            output_bytes += packet.size();

            if (verbose) {
                std::cout << "  frame " << frames << ": " << packet.size() << " bytes" << std::endl;
            }
            frames++;
        }

        encoder.close();
        DEBUG_LOG(DebugChannel::kEnc, "Encoded ", frames, " frame(s)");

        std::cout << "Frames: " << frames << std::endl;
        std::cout << "Input: " << input_bytes << " bytes" << std::endl;
        std::cout << "Output: " << output_bytes << " bytes" << std::endl;
        if (output_bytes > 0) {
            std::cout << "Ratio: " << std::fixed << std::setprecision(2)
                      << static_cast<double>(input_bytes) / static_cast<double>(output_bytes) << ":1" << std::endl;
        }
    } catch (const Exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        Debug::shutdown();
        return 1;
    }

    Debug::shutdown();
    return 0;
}
