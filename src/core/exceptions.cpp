/*
 * exceptions.cpp - OpusWire failure taxonomy
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

namespace {

// Helper for building a std::visit overload set from lambdas.
template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // anonymous namespace

/**
 * @brief Constructs an Exception from a failure value.
 *
 * The explanatory string is rendered once, here, so that what() never
 * allocates.
 * @param error The failure being reported.
 */
Exception::Exception(Error error)
    : std::exception(), m_error(std::move(error)), m_why(describe(m_error)) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string describing the failure. For codec failures this
 *         is the native library's own message, verbatim.
 */
const char *Exception::what() const noexcept {
  return m_why.c_str();
}

std::string Exception::describe(const Error& error) {
  return std::visit(Overloaded{
      [](const LoadError& e) {
        return "Failed to load " + e.library + ": " + e.reason;
      },
      [](const NotLoadedError&) {
        return std::string("Opus library is not loaded");
      },
      [](const CodecError& e) {
        return e.message;
      },
      [](const ClosedStateError& e) {
        return "Encoder is closed: " + e.operation;
      }
  }, error);
}

} // namespace OpusWire
