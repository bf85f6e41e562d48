#pragma once

#include "ecs/Entity.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace overworld {

/// Raised by Registry::get / Registry::getRef when the entity lacks the
/// requested component. This is a programmer error; code that can tolerate
/// absence uses tryGet / tryGetRef instead.
class ComponentNotFound : public std::out_of_range {
public:
    ComponentNotFound(Entity entity, std::string_view componentName)
        : std::out_of_range(buildMessage(entity, componentName))
        , m_entity(entity)
        , m_componentName(componentName) {}

    Entity entity() const { return m_entity; }
    const std::string& componentName() const { return m_componentName; }

private:
    static std::string buildMessage(Entity entity, std::string_view componentName) {
        std::string msg = "component '";
        msg.append(componentName.data(), componentName.size());
        msg += "' not found on entity ";
        msg += std::to_string(entityIndex(entity));
        msg += "v";
        msg += std::to_string(entityGeneration(entity));
        return msg;
    }

    Entity m_entity;
    std::string m_componentName;
};

} // namespace overworld
