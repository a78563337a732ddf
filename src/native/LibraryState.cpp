/*
 * LibraryState.cpp - Process-wide codec library binding
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

LibraryState& LibraryState::getInstance() {
    static LibraryState instance;
    return instance;
}

LibraryState::LibraryState() {
    discover();
}

std::vector<std::string> LibraryState::discoveryCandidates() {
    const char* override_name = getenv(OPUSWIRE_LIBRARY_ENV);
    if (override_name && strlen(override_name) > 0) {
        return { override_name };
    }

#if defined(_WIN32)
    return { "opus.dll", "libopus-0.dll" };
#elif defined(__APPLE__)
    return { "libopus.0.dylib", "libopus.dylib" };
#else
    return { "libopus.so.0", "libopus.so" };
#endif
}

void LibraryState::discover() {
    for (const auto& candidate : discoveryCandidates()) {
        try {
            m_binding = CodecBinding::bind(candidate);
            Debug::log(DebugChannel::kNative, "LibraryState: Discovered codec library ", candidate);
            return;
        } catch (const Exception& e) {
            Debug::log(DebugChannel::kNative, "LibraryState: Discovery skipped ", candidate, ": ", e.what());
        }
    }

    Debug::log(DebugChannel::kNative, "LibraryState: No codec library found; encoding is unavailable until load() succeeds");
}

void LibraryState::load(const std::string& library_name) {
    // Bind first so that a failure leaves the current binding in place.
    auto binding = CodecBinding::bind(library_name);
    m_binding = std::move(binding);
    Debug::log(DebugChannel::kNative, "LibraryState::load: Now using ", library_name);
}

} // namespace Native

void load(const std::string& library_name) {
    Native::LibraryState::getInstance().load(library_name);
}

bool isLoaded() {
    return Native::LibraryState::getInstance().isLoaded();
}

} // namespace OpusWire
