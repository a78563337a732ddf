/*
 * FrameGeometry.cpp - Frame sizing derived from the sampling configuration
 * This file is part of OpusWire.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OpusWire is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "opuswire.h"

namespace OpusWire {
namespace Codec {
namespace Opus {

namespace {

struct WideGeometry {
    int64_t sample_size_bytes;
    int64_t samples_per_frame;
    int64_t frame_size_bytes;
};

// Same as floor(rate / 1000 * 20) without the float round trip. Every
// product fits in 64 bits for any pair of int inputs.
WideGeometry widen(int sampling_rate, int channels) {
    WideGeometry wide;
    wide.sample_size_bytes = static_cast<int64_t>(FrameGeometry::kBytesPerSample) * channels;
    wide.samples_per_frame = static_cast<int64_t>(sampling_rate) * FrameGeometry::kFrameLengthMs / 1000;
    wide.frame_size_bytes = wide.samples_per_frame * wide.sample_size_bytes;
    return wide;
}

} // anonymous namespace

bool FrameGeometry::representable(int sampling_rate, int channels) {
    if (sampling_rate <= 0 || channels <= 0) return false;

    WideGeometry wide = widen(sampling_rate, channels);
    return wide.sample_size_bytes <= std::numeric_limits<int>::max() &&
           wide.frame_size_bytes <= std::numeric_limits<int>::max();
}

FrameGeometry FrameGeometry::compute(int sampling_rate, int channels) {
    if (!representable(sampling_rate, channels)) {
        std::ostringstream oss;
        oss << "no frame geometry for " << sampling_rate << "Hz, " << channels << " channel(s)";
        throw std::out_of_range(oss.str());
    }

    WideGeometry wide = widen(sampling_rate, channels);
    FrameGeometry geometry;
    geometry.frame_length_ms = kFrameLengthMs;
    geometry.sample_size_bytes = static_cast<int>(wide.sample_size_bytes);
    geometry.samples_per_frame = static_cast<int>(wide.samples_per_frame);
    geometry.frame_size_bytes = static_cast<int>(wide.frame_size_bytes);
    return geometry;
}

} // namespace Opus
} // namespace Codec
} // namespace OpusWire
