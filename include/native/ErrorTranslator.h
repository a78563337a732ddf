/*
 * ErrorTranslator.h - Native status code to CodecError translation
 * This file is part of OpusWire.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OpusWire is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ERRORTRANSLATOR_H
#define ERRORTRANSLATOR_H

// No direct includes - all includes should be in opuswire.h

namespace OpusWire {
namespace Native {

class ErrorTranslator {
public:
    /**
     * @brief Message the currently bound library gives for a status code
     * @throws Exception holding NotLoadedError if no library is bound
     */
    static std::string translate(int code);

    /**
     * @brief Message the given binding gives for a status code
     */
    static std::string translate(const CodecBinding& binding, int code);

    /**
     * @brief Build the exception for a failed native call, logging it
     */
    static Exception codecFailure(const CodecBinding& binding, int code);
};

} // namespace Native
} // namespace OpusWire

#endif // ERRORTRANSLATOR_H
