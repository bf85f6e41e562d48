#include "engine/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <vector>

namespace overworld {

std::shared_ptr<spdlog::logger> Log::s_engineLogger;
std::shared_ptr<spdlog::logger> Log::s_loaderLogger;
std::unordered_set<std::string> Log::s_seenKeys;
std::mutex Log::s_seenMutex;
std::mutex Log::s_initMutex;
std::atomic<bool> Log::s_ready{false};

void Log::init(const std::string& logFile, const std::string& level) {
    std::lock_guard<std::mutex> lock(s_initMutex);
    initLocked(logFile, level);
}

void Log::initLocked(const std::string& logFile, const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    s_engineLogger = std::make_shared<spdlog::logger>("ENGINE", sinks.begin(), sinks.end());
    s_loaderLogger = std::make_shared<spdlog::logger>("LOADER", sinks.begin(), sinks.end());

    // from_str maps unknown names to off; only "off" itself should mean off
    auto spdLevel = spdlog::level::from_str(level);
    if (spdLevel == spdlog::level::off && level != "off") {
        spdLevel = spdlog::level::debug;
    }

    s_engineLogger->set_level(spdLevel);
    s_loaderLogger->set_level(spdLevel);

    // Re-initialization replaces the registered loggers of the same name
    spdlog::drop("ENGINE");
    spdlog::drop("LOADER");
    spdlog::register_logger(s_engineLogger);
    spdlog::register_logger(s_loaderLogger);
    s_ready.store(true, std::memory_order_release);
}

void Log::shutdown() {
    {
        std::lock_guard<std::mutex> lock(s_initMutex);
        s_ready.store(false, std::memory_order_release);
        spdlog::shutdown();
        s_engineLogger.reset();
        s_loaderLogger.reset();
    }
    resetOccurrences();
}

void Log::ensureInitialized() {
    // Loader workers may log before the main thread calls init()
    if (s_ready.load(std::memory_order_acquire)) {
        return;
    }
    std::lock_guard<std::mutex> lock(s_initMutex);
    if (!s_ready.load(std::memory_order_relaxed)) {
        initLocked("", "info");
    }
}

std::shared_ptr<spdlog::logger>& Log::getEngineLogger() {
    ensureInitialized();
    return s_engineLogger;
}

std::shared_ptr<spdlog::logger>& Log::getLoaderLogger() {
    ensureInitialized();
    return s_loaderLogger;
}

bool Log::firstOccurrence(const std::string& key) {
    std::lock_guard<std::mutex> lock(s_seenMutex);
    return s_seenKeys.insert(key).second;
}

void Log::resetOccurrences() {
    std::lock_guard<std::mutex> lock(s_seenMutex);
    s_seenKeys.clear();
}

} // namespace overworld
