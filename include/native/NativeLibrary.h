/*
 * NativeLibrary.h - RAII wrapper for dynamically loaded shared objects
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

#ifndef NATIVELIBRARY_H
#define NATIVELIBRARY_H

// No direct includes - all includes should be in opuswire.h

namespace OpusWire {
namespace Native {

/**
 * @brief RAII wrapper for a dynamically loaded shared library
 *
 * Owns the platform module handle and closes it on destruction. Opening
 * failures are reported as Exception(LoadError) carrying the loader's
 * own diagnostic.
 */
class NativeLibrary {
public:
    /**
     * @brief Open a shared library
     * @param name File name or path handed to the platform loader
     * @throws Exception holding LoadError if the library cannot be opened
     */
    explicit NativeLibrary(const std::string& name);

    /**
     * @brief Destructor - closes the module handle
     */
    ~NativeLibrary() noexcept;

    NativeLibrary(const NativeLibrary&) = delete;
    NativeLibrary& operator=(const NativeLibrary&) = delete;

    /**
     * @brief Look up an exported symbol
     * @param symbol_name Symbol to resolve
     * @return Symbol address, or nullptr if the library does not export it
     */
    void* getSymbol(const std::string& symbol_name) const noexcept;

    /**
     * @brief Most recent loader error message
     */
    static std::string lastError();

    const std::string& name() const noexcept { return m_name; }

private:
    std::string m_name;
    void* m_handle = nullptr;
};

} // namespace Native
} // namespace OpusWire

#endif // NATIVELIBRARY_H
