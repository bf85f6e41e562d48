#pragma once

#include "ecs/Registry.hpp"

#include <algorithm>
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace overworld {

/// Execution order inside a phase (lower runs first)
namespace SystemPriority {
    constexpr int Input         = 0;
    constexpr int Movement      = 100;
    constexpr int Animation     = 200;
    constexpr int TileAnimation = 250;
    constexpr int Spatial       = 300;
}

/// System execution phase
enum class SystemPhase {
    PreUpdate,      // Before main update (movement intent)
    Update,         // Main update (movement, animation)
    PostUpdate,     // After main update (index upkeep)
    PreRender,      // Before rendering (visibility queries)
    Render,         // Main rendering (external renderer)
    PostRender      // After rendering (diagnostics)
};

/// Base class for all per-frame systems. Systems run on the world thread only.
class System {
public:
    explicit System(const std::string& name, int priority = 0)
        : m_name(name), m_priority(priority) {}
    virtual ~System() = default;

    System(const System&) = delete;
    System& operator=(const System&) = delete;

    /// Bind the registry. Called once, by the scheduler or by hand in tools.
    virtual void init(Registry& registry) {
        m_registry = &registry;
    }

    /// One step of simulation (update phases) or one frame (render phases)
    virtual void update(float dt) = 0;

    /// Called when the system is removed or the scheduler shuts down
    virtual void shutdown() {}

    const std::string& getName() const { return m_name; }
    int getPriority() const { return m_priority; }

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

protected:
    Registry& getRegistry() { return *m_registry; }
    const Registry& getRegistry() const { return *m_registry; }

private:
    std::string m_name;
    int m_priority = 0;
    bool m_enabled = true;
    Registry* m_registry = nullptr;
};

/// Owns the systems and runs them phase by phase. Inside a phase systems run
/// by ascending priority; equal priorities keep the order they were added.
class SystemScheduler {
public:
    SystemScheduler() = default;

    SystemScheduler(const SystemScheduler&) = delete;
    SystemScheduler& operator=(const SystemScheduler&) = delete;

    /// Registry handed to every system added afterwards
    void init(Registry& registry) {
        m_registry = &registry;
    }

    template<typename T, typename... Args>
    T* addSystem(SystemPhase phase, Args&&... args) {
        auto system = std::make_unique<T>(std::forward<Args>(args)...);
        T* raw = system.get();
        addSystem(phase, std::move(system));
        return raw;
    }

    void addSystem(SystemPhase phase, std::unique_ptr<System> system) {
        system->init(*m_registry);
        auto& systems = slot(phase);
        auto pos = std::upper_bound(systems.begin(), systems.end(), system->getPriority(),
            [](int priority, const std::unique_ptr<System>& other) {
                return priority < other->getPriority();
            });
        systems.insert(pos, std::move(system));
    }

    /// Shut down and drop a system. Returns false if no system has that name.
    bool removeSystem(const std::string& name) {
        for (auto& systems : m_phases) {
            auto it = std::find_if(systems.begin(), systems.end(),
                [&name](const std::unique_ptr<System>& system) { return system->getName() == name; });
            if (it != systems.end()) {
                (*it)->shutdown();
                systems.erase(it);
                return true;
            }
        }
        return false;
    }

    void setSystemEnabled(const std::string& name, bool enabled) {
        for (auto& systems : m_phases) {
            for (auto& system : systems) {
                if (system->getName() == name) {
                    system->setEnabled(enabled);
                }
            }
        }
    }

    void runPhase(SystemPhase phase, float dt) {
        for (auto& system : slot(phase)) {
            if (system->isEnabled()) {
                system->update(dt);
            }
        }
    }

    /// One fixed simulation step
    void update(float dt) {
        runPhase(SystemPhase::PreUpdate, dt);
        runPhase(SystemPhase::Update, dt);
        runPhase(SystemPhase::PostUpdate, dt);
    }

    /// Once per frame, after the simulation steps
    void render(float dt) {
        runPhase(SystemPhase::PreRender, dt);
        runPhase(SystemPhase::Render, dt);
        runPhase(SystemPhase::PostRender, dt);
    }

    void shutdown() {
        for (auto& systems : m_phases) {
            for (auto& system : systems) {
                system->shutdown();
            }
            systems.clear();
        }
    }

    size_t getSystemCount(SystemPhase phase) const {
        return m_phases[index(phase)].size();
    }

    size_t getTotalSystemCount() const {
        size_t total = 0;
        for (const auto& systems : m_phases) {
            total += systems.size();
        }
        return total;
    }

    /// Names of the systems in a phase, in execution order
    std::vector<std::string> getExecutionOrder(SystemPhase phase) const {
        std::vector<std::string> names;
        for (const auto& system : m_phases[index(phase)]) {
            names.push_back(system->getName());
        }
        return names;
    }

private:
    static constexpr size_t PhaseCount = static_cast<size_t>(SystemPhase::PostRender) + 1;

    static size_t index(SystemPhase phase) { return static_cast<size_t>(phase); }
    std::vector<std::unique_ptr<System>>& slot(SystemPhase phase) { return m_phases[index(phase)]; }

    std::array<std::vector<std::unique_ptr<System>>, PhaseCount> m_phases;
    Registry* m_registry = nullptr;
};

} // namespace overworld
