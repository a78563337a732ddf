/*
 * test_opus_encoder_system.cpp - Encoder tests against the system libopus
 * This file is part of OpusWire.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OpusWire is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Every test skips when default discovery finds no libopus on this host.
 */

#include "opuswire.h"
#include "test_framework.h"

#include <cmath>

#ifdef HAVE_RAPIDCHECK
#include <rapidcheck.h>
#endif

using namespace OpusWire;
using namespace OpusWire::Codec::Opus;
using namespace TestFramework;

namespace {

const int kOpusRates[] = { 8000, 12000, 16000, 24000, 48000 };

std::vector<uint8_t> tonePcm(const FrameGeometry& geometry, int sampling_rate, int channels) {
    std::vector<int16_t> samples(static_cast<size_t>(geometry.samples_per_frame) * channels);
    for (int i = 0; i < geometry.samples_per_frame; i++) {
        double t = static_cast<double>(i) / sampling_rate;
        auto value = static_cast<int16_t>(std::lround(std::sin(2.0 * M_PI * 1000.0 * t) * 8000.0));
        for (int c = 0; c < channels; c++) {
            samples[static_cast<size_t>(i) * channels + c] = value;
        }
    }
    std::vector<uint8_t> bytes(samples.size() * sizeof(int16_t));
    std::memcpy(bytes.data(), samples.data(), bytes.size());
    return bytes;
}

void requireSystemLibrary() {
    if (!isLoaded()) {
        SKIP_TEST("libopus not found by default discovery");
    }
}

} // anonymous namespace

class SystemEncodeAllRatesTest : public TestCase {
public:
    SystemEncodeAllRatesTest() : TestCase("libopus encodes at every Opus rate") {}

protected:
    void setUp() override {
        requireSystemLibrary();
    }

    void runTest() override {
        for (int rate : kOpusRates) {
            for (int channels = 1; channels <= 2; channels++) {
                Encoder encoder(rate, channels, CodecApplication::Audio);
                std::vector<uint8_t> pcm = tonePcm(encoder.geometry(), rate, channels);

                std::vector<uint8_t> packet = encoder.encode(pcm, encoder.geometry().samples_per_frame);
                std::ostringstream what;
                what << rate << "Hz/" << channels << "ch packet";
                ASSERT_FALSE(packet.empty(), what.str() + " is not empty");
                ASSERT_TRUE(packet.size() <= pcm.size(), what.str() + " fits the input");
            }
        }
    }
};

class SystemCodecErrorTest : public TestCase {
public:
    SystemCodecErrorTest() : TestCase("libopus status codes become CodecError") {}

protected:
    void setUp() override {
        requireSystemLibrary();
    }

    void runTest() override {
        Exception e = TestPatterns::assertThrows<Exception>([]() { Encoder encoder(44100, 2); },
                                                           "", "44.1 kHz should be rejected");
        ASSERT_TRUE(e.is<CodecError>(), "Construction failure is a CodecError");
        ASSERT_EQUALS(static_cast<int>(Native::Status::BadArg), e.as<CodecError>().code, "OPUS_BAD_ARG");
        ASSERT_EQUALS(Native::ErrorTranslator::translate(e.as<CodecError>().code),
                      e.as<CodecError>().message, "Message comes from opus_strerror");

        Encoder encoder(48000, 2, CodecApplication::LowDelay);
        std::vector<uint8_t> pcm = tonePcm(encoder.geometry(), 48000, 2);
        Exception odd = TestPatterns::assertThrows<Exception>([&]() { encoder.encode(pcm, 100); },
                                                             "", "100 samples is not an Opus frame");
        ASSERT_TRUE(odd.is<CodecError>(), "Encode failure is a CodecError");
        ASSERT_TRUE(encoder.isReady(), "Encoder survives the failure");
        ASSERT_FALSE(encoder.encode(pcm).empty(), "Encoder still works");

        encoder.close();
        encoder.close();
        Exception closed = TestPatterns::assertThrows<Exception>([&]() { encoder.encode(pcm); },
                                                                "Encoder is closed", "encode() after close()");
        ASSERT_TRUE(closed.is<ClosedStateError>(), "Closed, not a codec error");
    }
};

#ifdef HAVE_RAPIDCHECK

// Property: any valid configuration encodes one frame into a bounded packet
bool test_encode_bounded_property() {
    return rc::check("encoded packet is non-empty and no longer than its input", []() {
        int rate = *rc::gen::element(8000, 12000, 16000, 24000, 48000);
        int channels = *rc::gen::inRange(1, 3);
        CodecApplication application = *rc::gen::element(CodecApplication::Audio,
                                                          CodecApplication::Voip,
                                                          CodecApplication::LowDelay);

        Encoder encoder(rate, channels, application);
        const FrameGeometry& geometry = encoder.geometry();
        std::vector<int16_t> samples = *rc::gen::container<std::vector<int16_t>>(
            static_cast<size_t>(geometry.samples_per_frame) * channels, rc::gen::arbitrary<int16_t>());

        std::vector<uint8_t> pcm(samples.size() * sizeof(int16_t));
        std::memcpy(pcm.data(), samples.data(), pcm.size());

        std::vector<uint8_t> packet = encoder.encode(pcm);
        RC_ASSERT(!packet.empty());
        RC_ASSERT(packet.size() <= pcm.size());
    });
}

#endif

// ============================================================================
// Test Registration
// ============================================================================

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("Opus Encoder System Library Tests");

    suite.addTest(std::make_unique<SystemEncodeAllRatesTest>());
    suite.addTest(std::make_unique<SystemCodecErrorTest>());

#ifdef HAVE_RAPIDCHECK
    suite.addTest("encode bounded property", []() {
        requireSystemLibrary();
        ASSERT_TRUE(test_encode_bounded_property(), "encode bounded property failed");
    });
#else
    std::cout << "RapidCheck not enabled, skipping property tests." << std::endl;
#endif

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
