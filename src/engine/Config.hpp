#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace overworld {

/// Runtime settings consumed by the core, resolved from a Config.
struct GameSettings {
    std::string logLevel = "info";
    std::string logFile;

    int tileSize = 16;                   // Pixels per tile when a map does not say otherwise
    double fixedTimestep = 1.0 / 60.0;   // Seconds per simulation step
    int maxStepsPerFrame = 5;            // Spiral-of-death guard

    float movementSpeed = 64.0f;         // Pixels per second for grid movement

    size_t entityLimit = 0;              // 0 = unlimited
    std::string assetRoot = "assets";
    std::string templatesFile;           // Object/NPC templates JSON (optional)
};

class Config {
public:
    /// Load configuration from a JSON file. Returns false if the file
    /// cannot be read or parsed; missing keys fall back to defaults.
    bool loadFromFile(const std::string& path);

    /// Load configuration from a JSON string (useful for testing).
    bool loadFromString(const std::string& jsonStr);

    /// Merge another JSON file on top of the current configuration.
    /// Keys in the overlay win; the current config is unchanged on failure.
    bool mergeFromFile(const std::string& path);

    // --- Getters (read with dot-notation key paths) ---

    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;
    float       getFloat(const std::string& key, float defaultVal = 0.0f) const;
    double      getDouble(const std::string& key, double defaultVal = 0.0) const;
    bool        getBool(const std::string& key, bool defaultVal = false) const;

    /// Check if a key exists (supports dot-notation, e.g. "world.tile_size").
    bool hasKey(const std::string& key) const;

    /// Resolve the settings the core understands. Out-of-range values are
    /// replaced by defaults and logged.
    GameSettings toSettings() const;

    const nlohmann::json& raw() const { return m_data; }

private:
    /// Resolve a dot-separated key path into the nested JSON value.
    const nlohmann::json* resolve(const std::string& key) const;

    static void mergeJson(nlohmann::json& base, const nlohmann::json& overlay);

    nlohmann::json m_data = nlohmann::json::object();
};

} // namespace overworld
