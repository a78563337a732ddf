/*
 * NativeLibrary.cpp - RAII wrapper for dynamically loaded shared objects
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

NativeLibrary::NativeLibrary(const std::string& name) : m_name(name) {
    if (name.empty()) {
        throw Exception(LoadError{ name, "empty library name" });
    }

    Debug::log(DebugChannel::kNative, "NativeLibrary: Opening ", name);

#ifdef _WIN32
    m_handle = reinterpret_cast<void*>(LoadLibraryA(name.c_str()));
#else
    // RTLD_LOCAL keeps the codec's symbols out of the global namespace so that
    // a reload can bind a different build of the same library.
    m_handle = dlopen(name.c_str(), RTLD_NOW | RTLD_LOCAL);
#endif

    if (!m_handle) {
        std::string reason = lastError();
        Debug::log(DebugChannel::kNative, "NativeLibrary: Failed to open ", name, ": ", reason);
        throw Exception(LoadError{ name, reason });
    }
}

NativeLibrary::~NativeLibrary() noexcept {
    if (!m_handle) return;

    Debug::log(DebugChannel::kNative, "NativeLibrary: Closing ", m_name);
#ifdef _WIN32
    FreeLibrary(static_cast<HMODULE>(m_handle));
#else
    dlclose(m_handle);
#endif
}

void* NativeLibrary::getSymbol(const std::string& symbol_name) const noexcept {
    if (!m_handle) return nullptr;

#ifdef _WIN32
    return reinterpret_cast<void*>(GetProcAddress(static_cast<HMODULE>(m_handle), symbol_name.c_str()));
#else
    return dlsym(m_handle, symbol_name.c_str());
#endif
}

std::string NativeLibrary::lastError() {
#ifdef _WIN32
    DWORD code = GetLastError();
    if (code == 0) return "unknown error";
    return "Windows error " + std::to_string(code);
#else
    const char* message = dlerror();
    return message ? std::string(message) : std::string("unknown error");
#endif
}

} // namespace Native
} // namespace OpusWire
