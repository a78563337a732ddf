/*
 * CodecBinding.h - Bound function table of the native Opus library
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

#ifndef CODECBINDING_H
#define CODECBINDING_H

// No direct includes - all includes should be in opuswire.h

namespace OpusWire {
namespace Native {

/**
 * @brief A loaded codec library together with its resolved entry points
 *
 * A binding is only ever constructed complete: every symbol listed in
 * kExportedFunctions has been resolved to a pointer of its declared
 * function type. Bindings are immutable and shared; an encoder keeps the
 * binding it was created with alive for as long as it holds native state.
 */
class CodecBinding {
public:
    /**
     * @brief Open a library and bind the encoder API
     * @param library_name File name or path of the shared library
     * @return The complete binding
     * @throws Exception holding LoadError if the library cannot be opened or
     *         any required symbol is missing
     */
    static std::shared_ptr<const CodecBinding> bind(const std::string& library_name);

    CodecBinding(const CodecBinding&) = delete;
    CodecBinding& operator=(const CodecBinding&) = delete;

    const std::string& libraryName() const noexcept { return m_library->name(); }

    // Thin forwarding calls into the native library
    const char* strerror(int error) const;
    int encoderGetSize(int channels) const;
    NativeEncoderState* encoderCreate(native_int32 sampling_rate, int channels,
                                      int application, int* error) const;
    native_int32 encode(NativeEncoderState* state, const native_int16* pcm, int frame_size,
                        unsigned char* data, native_int32 max_data_bytes) const;
    void encoderDestroy(NativeEncoderState* state) const;

private:
    explicit CodecBinding(std::unique_ptr<NativeLibrary> library);

    template<typename Func>
    Func* resolve(const FunctionDescriptor& descriptor) const;

    std::unique_ptr<NativeLibrary> m_library;

    StrErrorFunc* m_strerror = nullptr;
    EncoderGetSizeFunc* m_encoder_get_size = nullptr;
    EncoderCreateFunc* m_encoder_create = nullptr;
    EncodeFunc* m_encode = nullptr;
    EncoderDestroyFunc* m_encoder_destroy = nullptr;
};

} // namespace Native
} // namespace OpusWire

#endif // CODECBINDING_H
