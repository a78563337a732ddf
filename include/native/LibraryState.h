/*
 * LibraryState.h - Process-wide codec library binding
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

#ifndef LIBRARYSTATE_H
#define LIBRARYSTATE_H

// No direct includes - all includes should be in opuswire.h

namespace OpusWire {
namespace Native {

/**
 * @brief Holder of the currently bound codec library
 *
 * The first call to getInstance() tries default discovery. A discovery
 * failure is logged and otherwise ignored, so programs that never touch
 * audio keep working without the codec installed. load() replaces the
 * current binding; the last successful load wins.
 *
 * Thread safety: reading the binding is safe from any thread once loading
 * is done. load() is not serialised against concurrent encoder
 * construction; callers that reload while other threads create encoders
 * must provide that ordering themselves.
 */
class LibraryState {
public:
    static LibraryState& getInstance();

    /**
     * @brief Bind the named library, replacing the current binding
     * @param library_name File name or path of the shared library
     * @throws Exception holding LoadError; the previous binding is kept
     */
    void load(const std::string& library_name);

    bool isLoaded() const noexcept { return m_binding != nullptr; }

    /**
     * @brief Current binding, or nullptr if none is loaded
     */
    std::shared_ptr<const CodecBinding> current() const noexcept { return m_binding; }

    /**
     * @brief Library names tried by default discovery, in order
     *
     * The OPUSWIRE_OPUS_LIBRARY environment variable, if set, is the only
     * candidate. Otherwise the platform's usual names for libopus are used.
     */
    static std::vector<std::string> discoveryCandidates();

private:
    LibraryState();
    ~LibraryState() = default;
    LibraryState(const LibraryState&) = delete;
    LibraryState& operator=(const LibraryState&) = delete;

    void discover();

    std::shared_ptr<const CodecBinding> m_binding;
};

} // namespace Native

// Public surface
void load(const std::string& library_name);
bool isLoaded();

} // namespace OpusWire

#endif // LIBRARYSTATE_H
