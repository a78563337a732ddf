/*
 * OpusEncoder.h - Owner of one native Opus encoder
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

#ifndef OPUSENCODER_H
#define OPUSENCODER_H

// No direct includes - all includes should be in opuswire.h

namespace OpusWire {
namespace Codec {
namespace Opus {

enum class EncoderState {
    Uninitialized,
    Ready,
    Closed
};

inline std::ostream& operator<<(std::ostream& os, EncoderState state) {
    switch (state) {
        case EncoderState::Uninitialized: return os << "Uninitialized";
        case EncoderState::Ready: return os << "Ready";
        case EncoderState::Closed: return os << "Closed";
        default: return os << "Unknown";
    }
}

/**
 * @brief Opus encoder bound to the process-wide codec library
 *
 * Compresses 16-bit interleaved PCM into Opus packets. Each instance owns
 * exactly one native encoder state, which is destroyed once, by close() or
 * by the destructor, whichever comes first.
 *
 * An instance is not reentrant: concurrent encode() calls on the same
 * encoder, or close() racing an in-flight encode(), must be serialised by
 * the caller. encode() is blocking CPU work.
 */
class Encoder {
public:
    /**
     * @brief Create native encoder state
     * @param sampling_rate Input sampling rate in Hz
     * @param channels Number of interleaved channels
     * @param application Native tuning profile
     * @throws Exception holding NotLoadedError if no codec library is bound,
     *         or CodecError if the native library rejects the parameters
     */
    Encoder(int sampling_rate, int channels, CodecApplication application = CodecApplication::Audio);
    ~Encoder();

    Encoder(const Encoder&) = delete;
    Encoder& operator=(const Encoder&) = delete;
    Encoder(Encoder&&) = delete;
    Encoder& operator=(Encoder&&) = delete;

    /**
     * @brief Encode PCM into one Opus packet
     * @param pcm 16-bit native-endian interleaved samples, as bytes
     * @param frame_size Samples per channel to encode
     * @return The encoded packet; never longer than pcm
     * @throws Exception holding ClosedStateError after close(), or
     *         CodecError if the input is too short or the codec fails.
     *         A CodecError leaves the encoder usable.
     */
    std::vector<uint8_t> encode(const std::vector<uint8_t>& pcm, int frame_size);
    std::vector<uint8_t> encode(const uint8_t* pcm, size_t pcm_bytes, int frame_size);

    // One frame of the computed geometry
    std::vector<uint8_t> encode(const std::vector<uint8_t>& pcm);

    /**
     * @brief Destroy the native state. Safe to call any number of times.
     */
    void close() noexcept;

    EncoderState state() const noexcept { return m_state; }
    bool isReady() const noexcept { return m_state == EncoderState::Ready; }

    int samplingRate() const noexcept { return m_sampling_rate; }
    int channels() const noexcept { return m_channels; }
    CodecApplication application() const noexcept { return m_application; }
    const FrameGeometry& geometry() const noexcept { return m_geometry; }

private:
    // Value-initialised by the empty StateHandle; real handles always carry
    // the binding that created them.
    struct StateDeleter {
        const Native::CodecBinding* binding;
        void operator()(NativeEncoderState* state) const;
    };

    using StateHandle = std::unique_ptr<NativeEncoderState, StateDeleter>;

    static std::shared_ptr<const Native::CodecBinding> requireBinding();
    static FrameGeometry checkedGeometry(const Native::CodecBinding& binding,
                                         int sampling_rate, int channels);
    StateHandle createState();

    // Declared first: the binding check precedes every other validation, and
    // the library must outlive the native state in m_handle.
    std::shared_ptr<const Native::CodecBinding> m_binding;

    const int m_sampling_rate;
    const int m_channels;
    const CodecApplication m_application;
    const FrameGeometry m_geometry;

    StateHandle m_handle;
    EncoderState m_state = EncoderState::Uninitialized;
};

} // namespace Opus
} // namespace Codec
} // namespace OpusWire

#endif // OPUSENCODER_H
