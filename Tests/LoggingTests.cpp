//
// LoggingTests.cpp - Tests for the Maestro logging system
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <Logging/Logger.h>
#include <Logging/ConsoleSink.h>
#include <Logging/MemorySink.h>
#include <Logging/LogLevel.h>
#include <cstdio>
#include <format>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace MaestroEngine::Core::Logging;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("LogLevel conversions", "[logging]") {
    SECTION("String to LogLevel") {
        CHECK(stringToLogLevel("Trace") == LogLevel::Trace);
        CHECK(stringToLogLevel("debug") == LogLevel::Debug);
        CHECK(stringToLogLevel("INFO") == LogLevel::Info);
        CHECK(stringToLogLevel("Warning") == LogLevel::Warning);
        CHECK(stringToLogLevel("Error") == LogLevel::Error);
        CHECK(stringToLogLevel("Fatal") == LogLevel::Fatal);
        CHECK(stringToLogLevel("Off") == LogLevel::Off);
        CHECK(stringToLogLevel("Invalid") == LogLevel::Info); // Default
    }

    SECTION("LogLevel to string") {
        CHECK(logLevelToString(LogLevel::Trace) == std::string("TRACE"));
        CHECK(logLevelToString(LogLevel::Info) == std::string("INFO "));
        CHECK(logLevelToString(LogLevel::Warning) == std::string("WARN "));
        CHECK(logLevelToString(LogLevel::Off) == std::string("OFF  "));
    }

    SECTION("LogLevel to char") {
        CHECK(logLevelToChar(LogLevel::Debug) == 'D');
        CHECK(logLevelToChar(LogLevel::Error) == 'E');
    }
}

TEST_CASE("Basic logging functionality", "[logging]") {
    Logger logger("Test");
    auto memory = std::make_shared<MemorySink>();
    logger.addSink(memory);

    SECTION("Log at different levels") {
        logger.trace("test", "Trace message");
        logger.debug("test", "Debug message");
        logger.info("test", "Info message");
        logger.warning("test", "Warning message");
        logger.error("test", "Error message");
        logger.fatal("test", "Fatal message");

        auto entries = memory->entries();
        REQUIRE(entries.size() == 6);
        CHECK(entries[0].level == LogLevel::Trace);
        CHECK(entries[2].message == "Info message");
        CHECK(entries[5].level == LogLevel::Fatal);
    }

    SECTION("Format arguments are applied") {
        logger.info("test", "Number: {}, String: {}, Float: {:.2f}", 42, "hello", 3.14159);

        auto entries = memory->entries();
        REQUIRE(entries.size() == 1);
        CHECK(entries[0].message == "Number: 42, String: hello, Float: 3.14");
    }

    SECTION("Call site is recorded") {
        logger.warning("test", "Step '{}' slow", "build");

        auto entries = memory->entries();
        REQUIRE(entries.size() == 1);
        CHECK_THAT(std::string(entries[0].location.file_name()), ContainsSubstring("LoggingTests.cpp"));
        CHECK(entries[0].location.line() > 0);
    }

    SECTION("Category handling") {
        logger.info("CategoryA", "Message A");
        logger.info("CategoryB", "Message B");

        REQUIRE(memory->entriesForCategory("CategoryA").size() == 1);
        CHECK(memory->entriesForCategory("CategoryB")[0].message == "Message B");
    }
}

TEST_CASE("Log level filtering", "[logging]") {
    Logger logger("Test");
    auto memory = std::make_shared<MemorySink>();
    logger.addSink(memory);

    SECTION("Logger level filtering") {
        logger.setMinLevel(LogLevel::Warning);

        logger.debug("test", "Should not appear");
        logger.info("test", "Should not appear {}", 1);
        logger.warning("test", "Should appear");
        logger.error("test", "Should appear");

        CHECK(memory->size() == 2);
        CHECK_FALSE(logger.isEnabled(LogLevel::Info));
        CHECK(logger.isEnabled(LogLevel::Error));
    }

    SECTION("Sink level filtering") {
        memory->setMinLevel(LogLevel::Info);

        logger.trace("test", "Should not appear");
        logger.info("test", "Should appear");
        logger.warning("test", "Should appear");

        auto entries = memory->entries();
        REQUIRE(entries.size() == 2);
        CHECK(entries[0].level == LogLevel::Info);
        CHECK(entries[1].level == LogLevel::Warning);
    }

    SECTION("Off disables everything") {
        logger.setMinLevel(LogLevel::Off);
        logger.fatal("test", "Nothing");
        CHECK(memory->size() == 0);
    }
}

TEST_CASE("Multiple sinks", "[logging]") {
    Logger logger("Test");
    auto sink1 = std::make_shared<MemorySink>();
    auto sink2 = std::make_shared<MemorySink>();

    logger.addSink(sink1);
    logger.addSink(sink2);
    CHECK(logger.getSinkCount() == 2);

    SECTION("Messages go to all sinks") {
        logger.info("test", "Message to all sinks");

        CHECK(sink1->contains("all sinks"));
        CHECK(sink2->contains("all sinks"));
    }

    SECTION("Remove sink") {
        logger.removeSink(sink2);
        logger.info("test", "Only to sink1");

        CHECK(sink1->size() == 1);
        CHECK(sink2->size() == 0);
    }

    SECTION("Clear sinks") {
        logger.clearSinks();
        logger.info("test", "Goes nowhere");

        CHECK(logger.getSinkCount() == 0);
        CHECK(sink1->size() == 0);
    }
}

TEST_CASE("MemorySink ring buffer", "[logging][memorysink]") {
    SECTION("Zero capacity is rejected") {
        CHECK_THROWS_AS(MemorySink(0), std::invalid_argument);
    }

    SECTION("Oldest entries are dropped first") {
        Logger logger("Test");
        auto memory = std::make_shared<MemorySink>(3);
        logger.addSink(memory);

        for (int i = 0; i < 5; ++i) {
            logger.info("ring", "entry {}", i);
        }

        auto entries = memory->entries();
        REQUIRE(entries.size() == 3);
        CHECK(entries.front().message == "entry 2");
        CHECK(entries.back().message == "entry 4");
        CHECK(memory->droppedCount() == 2);
        CHECK_FALSE(memory->contains("entry 1"));

        memory->clear();
        CHECK(memory->size() == 0);
        CHECK(memory->droppedCount() == 0);
    }
}

TEST_CASE("Thread safety", "[logging]") {
    Logger logger("Test");
    auto memory = std::make_shared<MemorySink>(10000);
    logger.addSink(memory);

    const int numThreads = 10;
    const int messagesPerThread = 100;

    std::vector<std::thread> threads;
    for (int i = 0; i < numThreads; ++i) {
        threads.emplace_back([&logger, i]() {
            for (int j = 0; j < messagesPerThread; ++j) {
                logger.info("thread", "Thread {} message {}", i, j);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto entries = memory->entries();
    CHECK(entries.size() == numThreads * messagesPerThread);

    std::vector<std::vector<bool>> seen(numThreads, std::vector<bool>(messagesPerThread, false));
    for (const auto& entry : entries) {
        int thread = -1, message = -1;
        if (std::sscanf(entry.message.c_str(), "Thread %d message %d", &thread, &message) == 2) {
            REQUIRE(thread >= 0);
            REQUIRE(thread < numThreads);
            REQUIRE(message >= 0);
            REQUIRE(message < messagesPerThread);
            CHECK(!seen[thread][message]); // No duplicates
            seen[thread][message] = true;
        }
    }

    for (int i = 0; i < numThreads; ++i) {
        for (int j = 0; j < messagesPerThread; ++j) {
            CHECK(seen[i][j]);
        }
    }
}

TEST_CASE("Global logger", "[logging]") {
    auto memory = std::make_shared<MemorySink>();
    Logger::global().addSink(memory);

    SECTION("Access global logger") {
        Logger::global().info("global", "Global message");
        CHECK(memory->contains("Global message"));
    }

    SECTION("Macros use global logger") {
        MAESTRO_LOG_INFO("Macro message");

        auto entries = memory->entries();
        REQUIRE(entries.size() == 1);
        CHECK(entries[0].message == "Macro message");
    }

    SECTION("Category macros") {
        MAESTRO_LOG_WARNING_CAT("CustomCategory", "Category {} message", "macro");

        auto entries = memory->entriesForCategory("CustomCategory");
        REQUIRE(entries.size() == 1);
        CHECK(entries[0].message == "Category macro message");
        CHECK(entries[0].level == LogLevel::Warning);
    }

    Logger::global().removeSink(memory);
}

TEST_CASE("Console sink output format", "[logging]") {
    ConsoleSink sink(false, false);
    LogEntry entry(LogLevel::Info, "TestCategory", "Test message");

    std::string line = sink.formatEntry(entry);
    CHECK_THAT(line, ContainsSubstring("[INFO ]"));
    CHECK_THAT(line, ContainsSubstring("[TestCategory]"));
    CHECK_THAT(line, ContainsSubstring("Test message"));

    SECTION("Color codes only when enabled") {
        CHECK_THAT(line, !ContainsSubstring("\033["));
        sink.setUseColor(true);
        CHECK_THAT(sink.formatEntry(entry), ContainsSubstring("\033["));
    }

    SECTION("Location when enabled") {
        sink.setShowLocation(true);
        CHECK_THAT(sink.formatEntry(entry), ContainsSubstring("LoggingTests.cpp"));
    }
}
