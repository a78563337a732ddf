/*
 * test_config.cpp - Tests for configuration file parsing and overrides
 * This file is part of OpusWire.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OpusWire is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "opuswire.h"
#include "test_framework.h"

using namespace OpusWire;
using namespace OpusWire::Core;
using namespace TestFramework;

namespace {

// Scratch file removed again when the test ends
class TempConfigFile {
public:
    explicit TempConfigFile(const std::string& contents)
        : m_path("opuswire_test_" + std::to_string(getpid()) + ".conf") {
        std::ofstream out(m_path);
        if (!out.is_open()) {
            throw TestSetupFailure("cannot create " + m_path);
        }
        out << contents;
    }

    ~TempConfigFile() {
        std::remove(m_path.c_str());
    }

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

} // anonymous namespace

class ConfigDefaultsTest : public TestCase {
public:
    ConfigDefaultsTest() : TestCase("Config defaults") {}

protected:
    void runTest() override {
        Config config = Config::fromFile("/nonexistent/opuswire.conf");
        ASSERT_TRUE(config.library.empty(), "Library defaults to discovery");
        ASSERT_EQUALS(48000, config.sampling_rate, "Default rate");
        ASSERT_EQUALS(2, config.channels, "Default channels");
        ASSERT_EQUALS(CodecApplication::Audio, config.application, "Default application");
        ASSERT_TRUE(config.log_file.empty(), "Logs to stdout");
        ASSERT_TRUE(config.debug_channels.empty(), "No debug channels");
    }
};

class ConfigFileTest : public TestCase {
public:
    ConfigFileTest() : TestCase("Config file parsing") {}

protected:
    void runTest() override {
        TempConfigFile file(
            "# OpusWire settings\n"
            "library = /opt/opus/lib/libopus.so.0\n"
            "\n"
            "rate=16000\n"
            "  channels = 1  \n"
            "application=voip\n"
            "log_file=/tmp/opuswire.log\n"
            "debug = native, opus,,config\n"
            "colour=blue\n");

        Config config = Config::fromFile(file.path());
        ASSERT_EQUALS(std::string("/opt/opus/lib/libopus.so.0"), config.library, "library");
        ASSERT_EQUALS(16000, config.sampling_rate, "rate");
        ASSERT_EQUALS(1, config.channels, "channels are trimmed");
        ASSERT_EQUALS(CodecApplication::Voip, config.application, "application");
        ASSERT_EQUALS(std::string("/tmp/opuswire.log"), config.log_file, "log_file");
        ASSERT_EQUALS(static_cast<size_t>(3), config.debug_channels.size(), "Empty channel names dropped");
        ASSERT_EQUALS(std::string("native"), config.debug_channels[0], "First channel");
        ASSERT_EQUALS(std::string("config"), config.debug_channels[2], "Last channel");
    }
};

class ConfigApplyLineTest : public TestCase {
public:
    ConfigApplyLineTest() : TestCase("Config::applyLine") {}

protected:
    void runTest() override {
        Config config;
        ASSERT_TRUE(config.applyLine("rate=24000"), "Known key");
        ASSERT_EQUALS(24000, config.sampling_rate, "Rate applied");

        ASSERT_FALSE(config.applyLine("rate=fast"), "Non-numeric rate");
        ASSERT_FALSE(config.applyLine("rate=-8000"), "Negative rate");
        ASSERT_FALSE(config.applyLine("rate=8000Hz"), "Trailing garbage");
        ASSERT_FALSE(config.applyLine("rate=99999999999999"), "Out of range");
        ASSERT_EQUALS(24000, config.sampling_rate, "Malformed values keep the previous rate");

        ASSERT_FALSE(config.applyLine("channels=0"), "Zero channels");
        ASSERT_EQUALS(2, config.channels, "Channels unchanged");

        ASSERT_FALSE(config.applyLine("application=music"), "Unknown application");
        ASSERT_TRUE(config.applyLine("application=LowDelay"), "Application names ignore case");
        ASSERT_EQUALS(CodecApplication::LowDelay, config.application, "Application applied");

        ASSERT_FALSE(config.applyLine("# rate=8000"), "Comment");
        ASSERT_FALSE(config.applyLine("   "), "Blank line");
        ASSERT_FALSE(config.applyLine("rate"), "Missing separator");
        ASSERT_FALSE(config.applyLine("bitrate=64000"), "Unknown key");
        ASSERT_EQUALS(24000, config.sampling_rate, "Nothing else changed the rate");
    }
};

class ConfigEnvironmentTest : public TestCase {
public:
    ConfigEnvironmentTest() : TestCase("Config environment override") {}

protected:
    void tearDown() override {
        unsetenv(OPUSWIRE_LIBRARY_ENV);
    }

    void runTest() override {
        Config config;
        config.library = "from-file.so";

        unsetenv(OPUSWIRE_LIBRARY_ENV);
        config.applyEnvironment();
        ASSERT_EQUALS(std::string("from-file.so"), config.library, "Unset variable changes nothing");

        setenv(OPUSWIRE_LIBRARY_ENV, "", 1);
        config.applyEnvironment();
        ASSERT_EQUALS(std::string("from-file.so"), config.library, "Empty variable changes nothing");

        setenv(OPUSWIRE_LIBRARY_ENV, "/usr/lib/libopus.so.0", 1);
        config.applyEnvironment();
        ASSERT_EQUALS(std::string("/usr/lib/libopus.so.0"), config.library, "Variable overrides the file");
    }
};

class ConfigStoragePathTest : public TestCase {
public:
    ConfigStoragePathTest() : TestCase("Config storage path") {}

protected:
    void setUp() override {
        const char* xdg = getenv("XDG_CONFIG_HOME");
        const char* home = getenv("HOME");
        m_xdg = xdg ? std::optional<std::string>(xdg) : std::nullopt;
        m_home = home ? std::optional<std::string>(home) : std::nullopt;
    }

    void tearDown() override {
        restore("XDG_CONFIG_HOME", m_xdg);
        restore("HOME", m_home);
    }

    void runTest() override {
        setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
        ASSERT_EQUALS(std::string("/tmp/xdg/opuswire"), Config::getStoragePath(), "XDG path");
        ASSERT_EQUALS(std::string("/tmp/xdg/opuswire/opuswire.conf"), Config::defaultPath(), "Default file");

        unsetenv("XDG_CONFIG_HOME");
        setenv("HOME", "/home/tester", 1);
        ASSERT_EQUALS(std::string("/home/tester/.config/opuswire"), Config::getStoragePath(), "HOME fallback");
    }

private:
    static void restore(const char* name, const std::optional<std::string>& value) {
        if (value) {
            setenv(name, value->c_str(), 1);
        } else {
            unsetenv(name);
        }
    }

    std::optional<std::string> m_xdg;
    std::optional<std::string> m_home;
};

// ============================================================================
// Test Registration
// ============================================================================

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("Config Tests");

    suite.addTest(std::make_unique<ConfigDefaultsTest>());
    suite.addTest(std::make_unique<ConfigFileTest>());
    suite.addTest(std::make_unique<ConfigApplyLineTest>());
    suite.addTest(std::make_unique<ConfigEnvironmentTest>());
    suite.addTest(std::make_unique<ConfigStoragePathTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
