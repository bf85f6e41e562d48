#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <fstream>
#include <sstream>
#include <string_view>

namespace overworld {

namespace {

bool parseDocument(std::istream& in, const std::string& source, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Config: cannot parse {}: {}", source, e.what());
        return false;
    }
    return true;
}

/// Reads the value when it has the accepted JSON type, else the fallback
template<typename T>
T readAs(const nlohmann::json* node, bool (nlohmann::json::*accepts)() const noexcept, T fallback) {
    if (node == nullptr || !(node->*accepts)()) {
        return fallback;
    }
    return node->get<T>();
}

/// Keeps `current` unless the candidate passes the check; rejected values are logged
template<typename T>
void acceptPositive(T& current, T candidate, const char* key) {
    if (candidate > T{}) {
        current = candidate;
    } else {
        LOG_WARN("Config: {} must be positive (got {}), keeping {}", key, candidate, current);
    }
}

} // namespace

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return false;
    }
    return parseDocument(file, "'" + path + "'", m_data);
}

bool Config::loadFromString(const std::string& jsonStr) {
    std::istringstream in(jsonStr);
    nlohmann::json parsed;
    if (!parseDocument(in, "inline config", parsed)) {
        return false;
    }
    m_data = std::move(parsed);
    return true;
}

bool Config::mergeFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return false;
    }

    nlohmann::json overlay;
    if (!parseDocument(file, "overlay '" + path + "'", overlay)) {
        return false;
    }

    nlohmann::json merged = m_data;
    mergeJson(merged, overlay);
    m_data = std::move(merged);
    return true;
}

// --- Lookup -----------------------------------------------------------------

const nlohmann::json* Config::resolve(const std::string& key) const {
    const nlohmann::json* node = &m_data;
    std::string_view rest = key;

    while (!rest.empty()) {
        const size_t dot = rest.find('.');
        const std::string segment(rest.substr(0, dot));
        rest = (dot == std::string_view::npos) ? std::string_view{} : rest.substr(dot + 1);

        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(segment);
        if (it == node->end()) {
            return nullptr;
        }
        node = &*it;
    }
    return node;
}

bool Config::hasKey(const std::string& key) const {
    return resolve(key) != nullptr;
}

std::string Config::getString(const std::string& key, const std::string& defaultVal) const {
    return readAs<std::string>(resolve(key), &nlohmann::json::is_string, defaultVal);
}

int Config::getInt(const std::string& key, int defaultVal) const {
    return readAs<int>(resolve(key), &nlohmann::json::is_number_integer, defaultVal);
}

float Config::getFloat(const std::string& key, float defaultVal) const {
    return readAs<float>(resolve(key), &nlohmann::json::is_number, defaultVal);
}

double Config::getDouble(const std::string& key, double defaultVal) const {
    return readAs<double>(resolve(key), &nlohmann::json::is_number, defaultVal);
}

bool Config::getBool(const std::string& key, bool defaultVal) const {
    return readAs<bool>(resolve(key), &nlohmann::json::is_boolean, defaultVal);
}

// --- Settings ---------------------------------------------------------------

GameSettings Config::toSettings() const {
    GameSettings s;

    s.logLevel = getString("log.level", s.logLevel);
    s.logFile = getString("log.file", s.logFile);

    acceptPositive(s.tileSize, getInt("world.tile_size", s.tileSize), "world.tile_size");
    acceptPositive(s.fixedTimestep, getDouble("world.fixed_timestep", s.fixedTimestep),
                   "world.fixed_timestep");
    acceptPositive(s.maxStepsPerFrame, getInt("world.max_steps_per_frame", s.maxStepsPerFrame),
                   "world.max_steps_per_frame");
    acceptPositive(s.movementSpeed, getFloat("movement.speed", s.movementSpeed), "movement.speed");

    // Zero or negative means no limit
    const int limit = getInt("loader.entity_limit", 0);
    s.entityLimit = limit > 0 ? static_cast<size_t>(limit) : 0;
    s.assetRoot = getString("loader.asset_root", s.assetRoot);
    s.templatesFile = getString("loader.templates", s.templatesFile);

    return s;
}

void Config::mergeJson(nlohmann::json& base, const nlohmann::json& overlay) {
    if (!overlay.is_object() || !base.is_object()) {
        base = overlay;
        return;
    }
    for (const auto& [name, value] : overlay.items()) {
        auto existing = base.find(name);
        if (existing != base.end() && existing->is_object() && value.is_object()) {
            mergeJson(*existing, value);
        } else {
            base[name] = value;
        }
    }
}

} // namespace overworld
