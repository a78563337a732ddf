/*
 * exceptions.h - OpusWire failure taxonomy
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

#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

namespace OpusWire {

// The codec library could not be opened, or a required symbol is missing.
struct LoadError {
    std::string library;
    std::string reason;
};

// An encoder was requested while no codec library is bound.
struct NotLoadedError {
};

// The native codec reported a failure status.
struct CodecError {
    int code;
    std::string message;
};

// Operation attempted on an encoder that has already been torn down.
struct ClosedStateError {
    std::string operation;
};

using Error = std::variant<LoadError, NotLoadedError, CodecError, ClosedStateError>;

/**
 * @brief The single exception type raised by OpusWire.
 *
 * Carries the failure as a closed variant so that callers can handle every
 * kind exhaustively with std::visit, or test for one with is<T>().
 */
class Exception : public std::exception
{
    public:
        explicit Exception(Error error);
        ~Exception() noexcept override = default;
        const char *what() const noexcept override;

        const Error& error() const noexcept { return m_error; }

        template<typename T>
        bool is() const noexcept { return std::holds_alternative<T>(m_error); }

        template<typename T>
        const T& as() const { return std::get<T>(m_error); }

    private:
        static std::string describe(const Error& error);

        Error m_error;
        std::string m_why;
};

} // namespace OpusWire

#endif // EXCEPTIONS_H
