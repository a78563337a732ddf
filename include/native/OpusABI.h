/*
 * OpusABI.h - Binary interface of the native Opus encoder API
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

#ifndef OPUSABI_H
#define OPUSABI_H

// No direct includes - all includes should be in opuswire.h

/*
 * The codec library is bound at runtime, so nothing here comes from the
 * codec's own headers. Every declaration below must agree bit for bit with
 * the exported C interface: argument order, integer widths and pointer
 * semantics. tests/test_native_abi_conformance.cpp checks the constants
 * against <opus/opus.h> when the development headers are available.
 */

// Opaque encoder state living inside the native library.
struct NativeEncoderState;

namespace OpusWire {
namespace Native {

// opus_int32 / opus_int16 on every platform libopus supports
using native_int32 = std::int32_t;
using native_int16 = std::int16_t;

// Exported function types
using StrErrorFunc = const char *(int error);
using EncoderGetSizeFunc = int (int channels);
using EncoderCreateFunc = NativeEncoderState *(native_int32 sampling_rate, int channels,
                                               int application, int *error);
using EncodeFunc = native_int32 (NativeEncoderState *state, const native_int16 *pcm,
                                 int frame_size, unsigned char *data,
                                 native_int32 max_data_bytes);
using EncoderDestroyFunc = void (NativeEncoderState *state);

/**
 * @brief One entry of the foreign function table
 */
struct FunctionDescriptor {
    const char *symbol;     ///< Exported symbol name
    const char *signature;  ///< C prototype, for diagnostics
};

// Every symbol that must resolve for a binding to be usable
inline constexpr std::array<FunctionDescriptor, 5> kExportedFunctions = {{
    { "opus_strerror",         "const char *(int)" },
    { "opus_encoder_get_size", "int (int)" },
    { "opus_encoder_create",   "OpusEncoder *(opus_int32, int, int, int *)" },
    { "opus_encode",           "opus_int32 (OpusEncoder *, const opus_int16 *, int, unsigned char *, opus_int32)" },
    { "opus_encoder_destroy",  "void (OpusEncoder *)" },
}};

/**
 * @brief Native status codes
 */
enum class Status : int {
    OK = 0,
    BadArg = -1,
    BufferTooSmall = -2,
    InternalError = -3,
    InvalidPacket = -4,
    Unimplemented = -5,
    InvalidState = -6,
    AllocFail = -7
};

} // namespace Native

/**
 * @brief Native tuning profile passed to the encoder at creation
 */
enum class CodecApplication : int {
    Voip = 2048,
    Audio = 2049,
    LowDelay = 2051
};

const char *applicationName(CodecApplication application);
std::optional<CodecApplication> parseApplication(const std::string& name);

inline std::ostream& operator<<(std::ostream& os, CodecApplication application) {
    return os << applicationName(application);
}

} // namespace OpusWire

#endif // OPUSABI_H
