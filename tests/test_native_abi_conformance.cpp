/*
 * test_native_abi_conformance.cpp - Checks the bound ABI against the libopus headers
 * This file is part of OpusWire.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OpusWire is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Only built when pkg-config finds opus. Nothing here calls into libopus;
 * the checks are on types and constants.
 */

#include "opuswire.h"
#include "test_framework.h"

#include <opus/opus.h>
#include <type_traits>

using namespace OpusWire;
using namespace OpusWire::Native;
using namespace TestFramework;

static_assert(std::is_same<native_int32, opus_int32>::value, "opus_int32 width");
static_assert(std::is_same<native_int16, opus_int16>::value, "opus_int16 width");

static_assert(static_cast<int>(CodecApplication::Audio) == OPUS_APPLICATION_AUDIO, "audio profile");
static_assert(static_cast<int>(CodecApplication::Voip) == OPUS_APPLICATION_VOIP, "voip profile");
static_assert(static_cast<int>(CodecApplication::LowDelay) == OPUS_APPLICATION_RESTRICTED_LOWDELAY,
              "restricted low delay profile");

static_assert(static_cast<int>(Status::OK) == OPUS_OK, "OPUS_OK");
static_assert(static_cast<int>(Status::BadArg) == OPUS_BAD_ARG, "OPUS_BAD_ARG");
static_assert(static_cast<int>(Status::BufferTooSmall) == OPUS_BUFFER_TOO_SMALL, "OPUS_BUFFER_TOO_SMALL");
static_assert(static_cast<int>(Status::InternalError) == OPUS_INTERNAL_ERROR, "OPUS_INTERNAL_ERROR");
static_assert(static_cast<int>(Status::InvalidPacket) == OPUS_INVALID_PACKET, "OPUS_INVALID_PACKET");
static_assert(static_cast<int>(Status::Unimplemented) == OPUS_UNIMPLEMENTED, "OPUS_UNIMPLEMENTED");
static_assert(static_cast<int>(Status::InvalidState) == OPUS_INVALID_STATE, "OPUS_INVALID_STATE");
static_assert(static_cast<int>(Status::AllocFail) == OPUS_ALLOC_FAIL, "OPUS_ALLOC_FAIL");

// Function types. Only the opaque encoder type differs from the real
// prototypes, so each side is checked against the same spelled-out signature.
static_assert(std::is_same<StrErrorFunc, decltype(opus_strerror)>::value, "opus_strerror");
static_assert(std::is_same<EncoderGetSizeFunc, decltype(opus_encoder_get_size)>::value, "opus_encoder_get_size");
static_assert(std::is_same<NativeEncoderState* (opus_int32, int, int, int*),
                           EncoderCreateFunc>::value, "opus_encoder_create");
static_assert(std::is_same<OpusEncoder* (opus_int32, int, int, int*),
                           decltype(opus_encoder_create)>::value, "opus_encoder_create prototype");
static_assert(std::is_same<opus_int32 (NativeEncoderState*, const opus_int16*, int, unsigned char*, opus_int32),
                           EncodeFunc>::value, "opus_encode");
static_assert(std::is_same<opus_int32 (OpusEncoder*, const opus_int16*, int, unsigned char*, opus_int32),
                           decltype(opus_encode)>::value, "opus_encode prototype");
static_assert(std::is_same<void (NativeEncoderState*), EncoderDestroyFunc>::value, "opus_encoder_destroy");
static_assert(std::is_same<void (OpusEncoder*), decltype(opus_encoder_destroy)>::value,
              "opus_encoder_destroy prototype");

class DescriptorTableTest : public TestCase {
public:
    DescriptorTableTest() : TestCase("Descriptor table names the libopus symbols") {}

protected:
    void runTest() override {
        const char* expected[] = {
            "opus_strerror",
            "opus_encoder_get_size",
            "opus_encoder_create",
            "opus_encode",
            "opus_encoder_destroy"
        };

        ASSERT_EQUALS(sizeof(expected) / sizeof(expected[0]), kExportedFunctions.size(), "Table size");
        for (size_t i = 0; i < kExportedFunctions.size(); i++) {
            ASSERT_EQUALS(std::string(expected[i]), std::string(kExportedFunctions[i].symbol),
                          "Symbol " + std::to_string(i));
            ASSERT_FALSE(std::string(kExportedFunctions[i].signature).empty(),
                         "Signature " + std::to_string(i));
        }
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("Native ABI Conformance Tests");

    suite.addTest(std::make_unique<DescriptorTableTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
