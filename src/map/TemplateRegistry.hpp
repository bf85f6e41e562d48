#pragma once

#include "ecs/Registry.hpp"
#include "ecs/Components.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace overworld {

/// Component bundle an object placement spawns with
struct EntityTemplate {
    std::string templateId;
    std::string name;

    // Sprite (category/name select the animation manifest)
    std::string spriteCategory;
    std::string spriteName;

    // Grid movement
    std::optional<float> tilesPerSecond;
    Direction facing = Direction::South;

    // Starting clip; defaults to the idle clip for `facing`
    std::string animation;

    bool solid = false;
    bool player = false;
    bool npc = false;
    std::string behavior;

    bool hasSprite() const { return !spriteName.empty(); }
};

/// Resolves an object's template id to a component bundle.
/// Returns nullptr for unknown ids.
class ITemplateResolver {
public:
    virtual ~ITemplateResolver() = default;
    virtual const EntityTemplate* resolve(const std::string& templateId) const = 0;
};

/// Template definitions keyed by id, loaded from JSON
class TemplateRegistry : public ITemplateResolver {
public:
    TemplateRegistry() = default;

    void registerTemplate(const EntityTemplate& tmpl) {
        m_templates[tmpl.templateId] = tmpl;
    }

    /// Register a template from JSON
    bool registerFromJson(const nlohmann::json& json);

    /// Load templates from a JSON file (array, {"templates": [...]} or a single object)
    bool loadFromFile(const std::string& path);

    /// Load templates from a JSON string
    bool loadFromString(const std::string& jsonStr);

    /// Built-in "player" and "npc/generic" templates
    void registerBuiltins();

    const EntityTemplate* resolve(const std::string& templateId) const override {
        auto it = m_templates.find(templateId);
        return it != m_templates.end() ? &it->second : nullptr;
    }

    bool hasTemplate(const std::string& templateId) const {
        return m_templates.contains(templateId);
    }

    std::vector<std::string> getTemplateIds() const;

    size_t size() const { return m_templates.size(); }

    void clear() { m_templates.clear(); }

    /// Attach a template's components to an existing entity. Per-object
    /// properties "direction", "behavior" and "npc_id" override the template.
    static void apply(Registry& registry, Entity entity, const EntityTemplate& tmpl,
                      int tileSize, const ObjectProperties* overrides = nullptr);

private:
    bool registerAll(const nlohmann::json& json, const std::string& source);

    std::unordered_map<std::string, EntityTemplate> m_templates;
};

} // namespace overworld
