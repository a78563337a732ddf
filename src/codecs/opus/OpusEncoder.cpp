/*
 * OpusEncoder.cpp - Owner of one native Opus encoder
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

namespace OpusWire {
namespace Codec {
namespace Opus {

void Encoder::StateDeleter::operator()(NativeEncoderState* state) const {
    if (state && binding) {
        binding->encoderDestroy(state);
    }
}

Encoder::Encoder(int sampling_rate, int channels, CodecApplication application)
    : m_binding(requireBinding()),
      m_sampling_rate(sampling_rate),
      m_channels(channels),
      m_application(application),
      m_geometry(checkedGeometry(*m_binding, sampling_rate, channels))
{
    m_handle = createState();
    m_state = EncoderState::Ready;

    Debug::log(DebugChannel::kOpus, "Encoder: Ready at ", m_sampling_rate, "Hz, ", m_channels,
               " channel(s), ", m_application, " profile, ", m_geometry);
}

std::shared_ptr<const Native::CodecBinding> Encoder::requireBinding() {
    auto binding = Native::LibraryState::getInstance().current();
    if (!binding) {
        Debug::log(DebugChannel::kOpus, "Encoder: No codec library is loaded");
        throw Exception(NotLoadedError{});
    }
    return binding;
}

FrameGeometry Encoder::checkedGeometry(const Native::CodecBinding& binding,
                                       int sampling_rate, int channels) {
    if (!FrameGeometry::representable(sampling_rate, channels)) {
        Debug::log(DebugChannel::kOpus, "Encoder: No frame geometry for ", sampling_rate, "Hz, ",
                   channels, " channel(s)");
        throw Native::ErrorTranslator::codecFailure(binding, static_cast<int>(Native::Status::BadArg));
    }
    return FrameGeometry::compute(sampling_rate, channels);
}

Encoder::~Encoder() {
    close();
}

Encoder::StateHandle Encoder::createState() {
    if (Debug::isChannelEnabled(DebugChannel::kOpus)) {
        DEBUG_LOG(DebugChannel::kOpus, "Native state size ", m_binding->encoderGetSize(m_channels), " bytes");
    }

    int error = static_cast<int>(Native::Status::OK);
    NativeEncoderState* state = m_binding->encoderCreate(m_sampling_rate, m_channels,
                                                         static_cast<int>(m_application), &error);

    // Take ownership before checking the status so that a non-null state
    // returned alongside an error is still released.
    StateHandle handle(state, StateDeleter{ m_binding.get() });

    if (error != static_cast<int>(Native::Status::OK)) {
        Debug::log(DebugChannel::kOpus, "Encoder::createState: error has happened in state creation");
        throw Native::ErrorTranslator::codecFailure(*m_binding, error);
    }

    if (!handle) {
        Debug::log(DebugChannel::kOpus, "Encoder::createState: Native library returned no state");
        throw Native::ErrorTranslator::codecFailure(*m_binding, static_cast<int>(Native::Status::AllocFail));
    }

    return handle;
}

std::vector<uint8_t> Encoder::encode(const std::vector<uint8_t>& pcm) {
    return encode(pcm.data(), pcm.size(), m_geometry.samples_per_frame);
}

std::vector<uint8_t> Encoder::encode(const std::vector<uint8_t>& pcm, int frame_size) {
    return encode(pcm.data(), pcm.size(), frame_size);
}

std::vector<uint8_t> Encoder::encode(const uint8_t* pcm, size_t pcm_bytes, int frame_size) {
    if (m_state != EncoderState::Ready) {
        throw Exception(ClosedStateError{ "encode" });
    }

    // The native side reads frame_size * channels samples unconditionally.
    if (frame_size <= 0 || !pcm || pcm_bytes < m_geometry.bytesForSamples(frame_size)) {
        Debug::log(DebugChannel::kOpus, "Encoder::encode: ", pcm_bytes, " bytes cannot hold ", frame_size,
                   " samples of ", m_channels, " channel(s)");
        throw Native::ErrorTranslator::codecFailure(*m_binding, static_cast<int>(Native::Status::BadArg));
    }

    const auto max_data_bytes = static_cast<Native::native_int32>(
        std::min<size_t>(pcm_bytes, static_cast<size_t>(std::numeric_limits<Native::native_int32>::max())));
    std::vector<uint8_t> data(static_cast<size_t>(max_data_bytes));

    const Native::native_int16* samples = reinterpret_cast<const Native::native_int16*>(pcm);
    std::vector<Native::native_int16> aligned;
    if (reinterpret_cast<uintptr_t>(pcm) % alignof(Native::native_int16) != 0) {
        size_t needed = m_geometry.bytesForSamples(frame_size);
        aligned.resize(needed / sizeof(Native::native_int16));
        std::memcpy(aligned.data(), pcm, needed);
        samples = aligned.data();
    }

    Native::native_int32 ret = m_binding->encode(m_handle.get(), samples, frame_size,
                                                 data.data(), max_data_bytes);
    if (ret < 0) {
        Debug::log(DebugChannel::kOpus, "Encoder::encode: error has happened in encode");
        throw Native::ErrorTranslator::codecFailure(*m_binding, static_cast<int>(ret));
    }

    data.resize(static_cast<size_t>(ret));
    return data;
}

void Encoder::close() noexcept {
    if (m_handle) {
        m_handle.reset();
        Debug::log(DebugChannel::kOpus, "Encoder::close: Native state destroyed");
    }
    m_state = EncoderState::Closed;
}

} // namespace Opus
} // namespace Codec
} // namespace OpusWire
