/*
 * FrameGeometry.h - Frame sizing derived from the sampling configuration
 * This file is part of OpusWire.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OpusWire is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FRAMEGEOMETRY_H
#define FRAMEGEOMETRY_H

// No direct includes - all includes should be in opuswire.h

namespace OpusWire {
namespace Codec {
namespace Opus {

/**
 * @brief Sizes of one encoder frame of 16-bit interleaved PCM
 *
 * Every field follows from the sampling rate, the channel count and the
 * fixed 20 ms frame length.
 */
struct FrameGeometry {
    static constexpr int kFrameLengthMs = 20;
    static constexpr int kBytesPerSample = 2;

    int frame_length_ms = kFrameLengthMs;
    int sample_size_bytes = 0;   ///< bytes per sample across all channels
    int samples_per_frame = 0;   ///< per channel
    int frame_size_bytes = 0;

    /**
     * @brief True if both inputs are positive and every field fits in an int
     */
    static bool representable(int sampling_rate, int channels);

    /**
     * @throws std::out_of_range unless representable(sampling_rate, channels)
     */
    static FrameGeometry compute(int sampling_rate, int channels);

    // Bytes occupied by the given number of per-channel samples
    size_t bytesForSamples(int samples) const {
        return static_cast<size_t>(samples) * static_cast<size_t>(sample_size_bytes);
    }

    bool operator==(const FrameGeometry& other) const {
        return frame_length_ms == other.frame_length_ms &&
               sample_size_bytes == other.sample_size_bytes &&
               samples_per_frame == other.samples_per_frame &&
               frame_size_bytes == other.frame_size_bytes;
    }
};

inline std::ostream& operator<<(std::ostream& os, const FrameGeometry& geometry) {
    return os << geometry.samples_per_frame << " samples/" << geometry.frame_length_ms << "ms, "
              << geometry.sample_size_bytes << " bytes/sample, "
              << geometry.frame_size_bytes << " bytes/frame";
}

} // namespace Opus
} // namespace Codec
} // namespace OpusWire

#endif // FRAMEGEOMETRY_H
