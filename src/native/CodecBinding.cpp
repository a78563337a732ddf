/*
 * CodecBinding.cpp - Bound function table of the native Opus library
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
namespace Native {

namespace {

enum FunctionIndex {
    FN_STRERROR = 0,
    FN_ENCODER_GET_SIZE,
    FN_ENCODER_CREATE,
    FN_ENCODE,
    FN_ENCODER_DESTROY
};

} // anonymous namespace

std::shared_ptr<const CodecBinding> CodecBinding::bind(const std::string& library_name) {
    Debug::log(DebugChannel::kNative, "CodecBinding::bind: Binding codec library: ", library_name);

    auto library = std::make_unique<NativeLibrary>(library_name);

    // The constructor throws on the first unresolved symbol; the library
    // handle is closed again as the unique_ptr unwinds.
    std::shared_ptr<const CodecBinding> binding(new CodecBinding(std::move(library)));

    Debug::log(DebugChannel::kNative, "CodecBinding::bind: Bound ", kExportedFunctions.size(),
               " functions from ", library_name);
    return binding;
}

CodecBinding::CodecBinding(std::unique_ptr<NativeLibrary> library)
    : m_library(std::move(library)) {
    m_strerror = resolve<StrErrorFunc>(kExportedFunctions[FN_STRERROR]);
    m_encoder_get_size = resolve<EncoderGetSizeFunc>(kExportedFunctions[FN_ENCODER_GET_SIZE]);
    m_encoder_create = resolve<EncoderCreateFunc>(kExportedFunctions[FN_ENCODER_CREATE]);
    m_encode = resolve<EncodeFunc>(kExportedFunctions[FN_ENCODE]);
    m_encoder_destroy = resolve<EncoderDestroyFunc>(kExportedFunctions[FN_ENCODER_DESTROY]);
}

template<typename Func>
Func* CodecBinding::resolve(const FunctionDescriptor& descriptor) const {
    void* symbol = m_library->getSymbol(descriptor.symbol);
    if (!symbol) {
        std::string reason = std::string("missing symbol ") + descriptor.symbol
                           + " with signature " + descriptor.signature;
        Debug::log(DebugChannel::kNative, "CodecBinding::resolve: ", m_library->name(), ": ", reason);
        throw Exception(LoadError{ m_library->name(), reason });
    }

    Debug::log(DebugChannel::kNative, "CodecBinding::resolve: ", descriptor.symbol, " -> ", descriptor.signature);
    return reinterpret_cast<Func*>(symbol);
}

const char* CodecBinding::strerror(int error) const {
    return m_strerror(error);
}

int CodecBinding::encoderGetSize(int channels) const {
    return m_encoder_get_size(channels);
}

NativeEncoderState* CodecBinding::encoderCreate(native_int32 sampling_rate, int channels,
                                                int application, int* error) const {
    return m_encoder_create(sampling_rate, channels, application, error);
}

native_int32 CodecBinding::encode(NativeEncoderState* state, const native_int16* pcm, int frame_size,
                                  unsigned char* data, native_int32 max_data_bytes) const {
    return m_encode(state, pcm, frame_size, data, max_data_bytes);
}

void CodecBinding::encoderDestroy(NativeEncoderState* state) const {
    m_encoder_destroy(state);
}

} // namespace Native
} // namespace OpusWire
