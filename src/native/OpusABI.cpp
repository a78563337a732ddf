/*
 * OpusABI.cpp - Application profile names
 * This file is part of OpusWire.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OpusWire is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "opuswire.h"

namespace OpusWire {

const char *applicationName(CodecApplication application) {
    switch (application) {
        case CodecApplication::Audio: return "audio";
        case CodecApplication::Voip: return "voip";
        case CodecApplication::LowDelay: return "lowdelay";
    }
    return "unknown";
}

std::optional<CodecApplication> parseApplication(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "audio") return CodecApplication::Audio;
    if (lower == "voip") return CodecApplication::Voip;
    if (lower == "lowdelay" || lower == "low-delay" || lower == "restricted_lowdelay") {
        return CodecApplication::LowDelay;
    }
    return std::nullopt;
}

} // namespace OpusWire
