#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace overworld {

class Log {
public:
    static void init(const std::string& logFile = "", const std::string& level = "debug");
    static void shutdown();

    static std::shared_ptr<spdlog::logger>& getEngineLogger();
    static std::shared_ptr<spdlog::logger>& getLoaderLogger();

    /// Returns true the first time a key is seen. Per-frame code uses this to
    /// report an anomaly once instead of every frame.
    static bool firstOccurrence(const std::string& key);

    /// Forget all keys recorded by firstOccurrence().
    static void resetOccurrences();

private:
    static void ensureInitialized();
    static void initLocked(const std::string& logFile, const std::string& level);

    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_loaderLogger;
    static std::unordered_set<std::string> s_seenKeys;
    static std::mutex s_seenMutex;
    static std::mutex s_initMutex;
    static std::atomic<bool> s_ready;
};

} // namespace overworld

// Engine logging macros
#define LOG_TRACE(...)    ::overworld::Log::getEngineLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::overworld::Log::getEngineLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::overworld::Log::getEngineLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::overworld::Log::getEngineLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::overworld::Log::getEngineLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::overworld::Log::getEngineLogger()->critical(__VA_ARGS__)

// Map loading pipeline macros
#define LOADER_LOG_TRACE(...)    ::overworld::Log::getLoaderLogger()->trace(__VA_ARGS__)
#define LOADER_LOG_DEBUG(...)    ::overworld::Log::getLoaderLogger()->debug(__VA_ARGS__)
#define LOADER_LOG_INFO(...)     ::overworld::Log::getLoaderLogger()->info(__VA_ARGS__)
#define LOADER_LOG_WARN(...)     ::overworld::Log::getLoaderLogger()->warn(__VA_ARGS__)
#define LOADER_LOG_ERROR(...)    ::overworld::Log::getLoaderLogger()->error(__VA_ARGS__)
#define LOADER_LOG_CRITICAL(...) ::overworld::Log::getLoaderLogger()->critical(__VA_ARGS__)

// Report once per key, then stay quiet
#define LOG_WARN_ONCE(key, ...) \
    do { if (::overworld::Log::firstOccurrence(key)) LOG_WARN(__VA_ARGS__); } while (0)
