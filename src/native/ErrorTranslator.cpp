/*
 * ErrorTranslator.cpp - Native status code to CodecError translation
 * This file is part of OpusWire.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OpusWire is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "opuswire.h"

namespace OpusWire {
namespace Native {

std::string ErrorTranslator::translate(int code) {
    auto binding = LibraryState::getInstance().current();
    if (!binding) {
        throw Exception(NotLoadedError{});
    }
    return translate(*binding, code);
}

std::string ErrorTranslator::translate(const CodecBinding& binding, int code) {
    const char* message = binding.strerror(code);
    if (!message) {
        return "unknown error " + std::to_string(code);
    }
    return std::string(message);
}

Exception ErrorTranslator::codecFailure(const CodecBinding& binding, int code) {
    std::string message = translate(binding, code);
    Debug::log(DebugChannel::kOpus, "\"", message, "\" has happened (", code, ")");
    return Exception(CodecError{ code, message });
}

} // namespace Native
} // namespace OpusWire
