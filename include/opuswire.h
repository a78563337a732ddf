/*
 * opuswire.h - master header file
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

#ifndef __OPUSWIRE_H__
#define __OPUSWIRE_H__

// defines
#define OPUSWIRE_VERSION "1.0.0"
#define OPUSWIRE_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"

// Environment variable naming the codec library to bind
#define OPUSWIRE_LIBRARY_ENV "OPUSWIRE_OPUS_LIBRARY"

//
// C++ Standard Library
#include <algorithm>
#include <array>
#include <chrono>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <sstream>
#include <unordered_set>
#include <variant>
#include <vector>

// C Standard Library (wrapped)
#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

// System-specific headers
#if defined(_WIN32)
#include <windows.h>
#else
#include <dlfcn.h>
#include <unistd.h>
#endif

// Local project headers (in dependency order where possible)
#include "debug.h"
#include "exceptions.h"
#include "native/OpusABI.h"
#include "native/NativeLibrary.h"
#include "native/CodecBinding.h"
#include "native/LibraryState.h"
#include "native/ErrorTranslator.h"
#include "codecs/opus/FrameGeometry.h"
#include "codecs/opus/OpusEncoder.h"
#include "core/Config.h"

#endif // __OPUSWIRE_H__
