#include "map/TemplateRegistry.hpp"
#include "gameplay/GridMovement.hpp"
#include "gameplay/SpriteAnimation.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <fstream>

namespace overworld {

bool TemplateRegistry::registerFromJson(const nlohmann::json& json) {
    try {
        if (!json.is_object() || !json.contains("id")) {
            LOG_ERROR("Template definition missing 'id' field");
            return false;
        }

        EntityTemplate tmpl;
        tmpl.templateId = json["id"].get<std::string>();
        tmpl.name = json.value("name", tmpl.templateId);

        if (json.contains("sprite")) {
            const auto& sprite = json["sprite"];
            if (sprite.is_string()) {
                tmpl.spriteCategory = "npcs";
                tmpl.spriteName = sprite.get<std::string>();
            } else {
                tmpl.spriteCategory = sprite.value("category", "npcs");
                tmpl.spriteName = sprite.value("name", "");
            }
        }

        if (json.contains("movement")) {
            const auto& move = json["movement"];
            tmpl.tilesPerSecond = move.value("tiles_per_second", 4.0f);
            if (*tmpl.tilesPerSecond <= 0.0f) {
                LOG_ERROR("Template '{}': tiles_per_second must be positive", tmpl.templateId);
                return false;
            }
        }

        std::string facing = json.value("facing", "south");
        tmpl.facing = parseDirection(facing);
        if (tmpl.facing == Direction::None) {
            LOG_WARN("Template '{}': unknown facing '{}', using south", tmpl.templateId, facing);
            tmpl.facing = Direction::South;
        }

        tmpl.animation = json.value("animation", "");
        tmpl.solid = json.value("solid", false);
        tmpl.player = json.value("player", false);

        if (json.contains("npc")) {
            tmpl.npc = true;
            const auto& npc = json["npc"];
            if (npc.is_object()) {
                tmpl.behavior = npc.value("behavior", "");
            }
        }

        registerTemplate(tmpl);
        LOG_DEBUG("Registered template: {}", tmpl.templateId);
        return true;

    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Failed to parse template JSON: {}", e.what());
        return false;
    }
}

bool TemplateRegistry::registerAll(const nlohmann::json& json, const std::string& source) {
    const nlohmann::json* list = nullptr;
    if (json.is_array()) {
        list = &json;
    } else if (json.is_object() && json.contains("templates")) {
        list = &json["templates"];
    } else {
        return registerFromJson(json);
    }

    bool allOk = true;
    for (const auto& entry : *list) {
        if (!registerFromJson(entry)) {
            LOG_WARN("Failed to register template from {}", source);
            allOk = false;
        }
    }
    return allOk;
}

bool TemplateRegistry::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open templates file: {}", path);
        return false;
    }

    try {
        nlohmann::json json;
        file >> json;
        bool ok = registerAll(json, path);
        LOG_INFO("Loaded templates from: {} ({} registered)", path, m_templates.size());
        return ok;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Failed to parse templates file '{}': {}", path, e.what());
        return false;
    }
}

bool TemplateRegistry::loadFromString(const std::string& jsonStr) {
    try {
        return registerAll(nlohmann::json::parse(jsonStr), "string");
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Failed to parse templates JSON: {}", e.what());
        return false;
    }
}

void TemplateRegistry::registerBuiltins() {
    EntityTemplate player;
    player.templateId = "player";
    player.name = "Player Character";
    player.spriteCategory = "players";
    player.spriteName = "player";
    player.tilesPerSecond = 4.0f;
    player.solid = true;
    player.player = true;
    registerTemplate(player);

    EntityTemplate npc;
    npc.templateId = "npc/generic";
    npc.name = "Generic NPC";
    npc.spriteCategory = "npcs";
    npc.spriteName = "generic";
    npc.tilesPerSecond = 2.0f;
    npc.solid = true;
    npc.npc = true;
    registerTemplate(npc);
}

std::vector<std::string> TemplateRegistry::getTemplateIds() const {
    std::vector<std::string> ids;
    ids.reserve(m_templates.size());
    for (const auto& [id, tmpl] : m_templates) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

void TemplateRegistry::apply(Registry& registry, Entity entity, const EntityTemplate& tmpl,
                             int tileSize, const ObjectProperties* overrides) {
    Direction facing = tmpl.facing;
    std::string behavior = tmpl.behavior;
    std::string npcId = tmpl.templateId;

    if (overrides) {
        if (const std::string* dir = overrides->find("direction")) {
            Direction parsed = parseDirection(*dir);
            if (parsed != Direction::None) facing = parsed;
        }
        if (const std::string* value = overrides->find("behavior")) behavior = *value;
        if (const std::string* value = overrides->find("npc_id")) npcId = *value;
    }

    if (tmpl.hasSprite()) {
        registry.set<Sprite>(entity, Sprite(tmpl.spriteCategory, tmpl.spriteName));
        registry.set<Animation>(entity, Animation(
            tmpl.animation.empty() ? idleAnimationName(facing) : tmpl.animation));
    }

    if (tmpl.tilesPerSecond) {
        GridMovement move(*tmpl.tilesPerSecond * static_cast<float>(tileSize), tileSize);
        move.facing = facing;
        registry.set<GridMovement>(entity, move);
    }

    if (tmpl.solid) {
        registry.set<Collision>(entity, Collision{true});
    }
    if (tmpl.player) {
        registry.set<Player>(entity, Player{});
    }
    if (tmpl.npc) {
        registry.set<Npc>(entity, Npc{npcId, behavior, facing});
    }
}

} // namespace overworld
