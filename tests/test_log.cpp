#include <gtest/gtest.h>
#include "engine/Log.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace overworld;

namespace {

size_t countOf(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

} // namespace

/// Initializes logging and tees both loggers into a string stream
class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::drop_all();
        Log::resetOccurrences();
    }

    void TearDown() override {
        Log::shutdown();
        spdlog::drop_all();
    }

    void initCaptured(const std::string& level) {
        Log::init("", level);
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
        sink->set_pattern("[%n] [%l] %v");
        Log::getEngineLogger()->sinks().push_back(sink);
        Log::getLoaderLogger()->sinks().push_back(sink);
    }

    std::string output() {
        Log::getEngineLogger()->flush();
        Log::getLoaderLogger()->flush();
        return captured.str();
    }

    std::ostringstream captured;
};

// =============================================================================
// Levels
// =============================================================================

TEST_F(LogTest, LevelNamesMapToSpdlogLevels) {
    Log::init("", "warn");
    EXPECT_EQ(Log::getEngineLogger()->level(), spdlog::level::warn);
    EXPECT_EQ(Log::getLoaderLogger()->level(), spdlog::level::warn);

    Log::init("", "error");
    EXPECT_EQ(Log::getEngineLogger()->level(), spdlog::level::err);

    Log::init("", "off");
    EXPECT_EQ(Log::getLoaderLogger()->level(), spdlog::level::off);
}

TEST_F(LogTest, UnknownLevelMeansDebug) {
    Log::init("", "chatty");
    EXPECT_EQ(Log::getEngineLogger()->level(), spdlog::level::debug);
    EXPECT_EQ(Log::getLoaderLogger()->level(), spdlog::level::debug);
}

TEST_F(LogTest, MessagesBelowLevelAreDropped) {
    initCaptured("warn");
    LOG_INFO("tileset cache warmed");
    LOADER_LOG_DEBUG("parsed layer {}", "ground");
    LOG_WARN("clip {} missing", "walk_north");

    std::string text = output();
    EXPECT_EQ(text.find("tileset cache warmed"), std::string::npos);
    EXPECT_EQ(text.find("parsed layer"), std::string::npos);
    EXPECT_NE(text.find("clip walk_north missing"), std::string::npos);
}

// =============================================================================
// Loggers
// =============================================================================

TEST_F(LogTest, LoaderMessagesCarryTheirOwnName) {
    initCaptured("trace");
    LOG_INFO("Map {} has {} tiles", "route_101", 10000);
    LOADER_LOG_ERROR("Tileset {} failed", "outdoor");

    std::string text = output();
    EXPECT_NE(text.find("[ENGINE] [info] Map route_101 has 10000 tiles"), std::string::npos);
    EXPECT_NE(text.find("[LOADER] [error] Tileset outdoor failed"), std::string::npos);
}

TEST_F(LogTest, LoggersAreRegisteredWithSpdlog) {
    Log::init();
    EXPECT_EQ(spdlog::get("ENGINE"), Log::getEngineLogger());
    EXPECT_EQ(spdlog::get("LOADER"), Log::getLoaderLogger());
}

TEST_F(LogTest, ReinitReplacesRegisteredLoggers) {
    Log::init();
    auto first = Log::getEngineLogger();
    Log::init("", "info");
    EXPECT_NE(Log::getEngineLogger(), first);
    EXPECT_EQ(spdlog::get("ENGINE"), Log::getEngineLogger());
}

TEST_F(LogTest, MacrosWorkBeforeInit) {
    Log::shutdown();
    EXPECT_NO_THROW(LOADER_LOG_INFO("lazy init"));
    ASSERT_NE(Log::getEngineLogger(), nullptr);
    EXPECT_EQ(Log::getEngineLogger()->level(), spdlog::level::info);
}

TEST_F(LogTest, ConcurrentFirstUseSharesOneLogger) {
    Log::shutdown();
    constexpr int workerCount = 8;
    std::vector<std::shared_ptr<spdlog::logger>> seen(workerCount);
    std::vector<std::thread> workers;
    for (int t = 0; t < workerCount; ++t) {
        workers.emplace_back([&seen, t]() {
            LOADER_LOG_DEBUG("tileset worker {} started", t);
            seen[t] = Log::getLoaderLogger();
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (const auto& logger : seen) {
        ASSERT_NE(logger, nullptr);
        EXPECT_EQ(logger, seen[0]);
    }
    EXPECT_EQ(spdlog::get("LOADER"), seen[0]);
}

// =============================================================================
// Once-only reporting
// =============================================================================

TEST_F(LogTest, FirstOccurrencePerKey) {
    EXPECT_TRUE(Log::firstOccurrence("missing-clip:walk_south"));
    EXPECT_FALSE(Log::firstOccurrence("missing-clip:walk_south"));
    EXPECT_TRUE(Log::firstOccurrence("missing-clip:walk_north"));

    Log::resetOccurrences();
    EXPECT_TRUE(Log::firstOccurrence("missing-clip:walk_south"));
}

TEST_F(LogTest, WarnOnceEmitsOneLinePerKey) {
    initCaptured("debug");
    for (int frame = 0; frame < 5; ++frame) {
        LOG_WARN_ONCE("ledge:outdoor", "Tileset {} has an unknown ledge direction", "outdoor");
        LOG_WARN_ONCE("ledge:cave", "Tileset {} has an unknown ledge direction", "cave");
    }

    std::string text = output();
    EXPECT_EQ(countOf(text, "Tileset outdoor has an unknown ledge direction"), 1u);
    EXPECT_EQ(countOf(text, "Tileset cave has an unknown ledge direction"), 1u);
}

TEST_F(LogTest, ShutdownForgetsReportedKeys) {
    Log::init();
    EXPECT_TRUE(Log::firstOccurrence("key"));
    Log::shutdown();
    EXPECT_TRUE(Log::firstOccurrence("key"));
}

// =============================================================================
// File sink
// =============================================================================

class LogFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::drop_all();
        logPath = (std::filesystem::temp_directory_path() / "overworld_test_log.txt").string();
        std::filesystem::remove(logPath);
    }

    void TearDown() override {
        Log::shutdown();
        spdlog::drop_all();
        std::filesystem::remove(logPath);
    }

    std::string logPath;
};

TEST_F(LogFileTest, BothLoggersShareTheFile) {
    Log::init(logPath, "debug");
    LOG_INFO("engine line");
    LOADER_LOG_INFO("loader line");
    Log::getEngineLogger()->flush();
    Log::getLoaderLogger()->flush();

    std::ifstream f(logPath);
    ASSERT_TRUE(f.good());
    std::string contents((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("[ENGINE] [info] engine line"), std::string::npos);
    EXPECT_NE(contents.find("[LOADER] [info] loader line"), std::string::npos);
}
