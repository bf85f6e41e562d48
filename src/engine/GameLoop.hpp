#pragma once

#include "ecs/Systems.hpp"

#include <atomic>
#include <cstdint>
#include <functional>

namespace overworld {

/// Single-threaded fixed-step loop: each frame runs the scheduler's update
/// phases zero or more times at the fixed timestep, then its render phases
/// once. Nothing else may mutate the registry while a frame runs.
class GameLoop {
public:
    explicit GameLoop(SystemScheduler& scheduler, double fixedTimestep = 1.0 / 60.0,
                      int maxStepsPerFrame = 5);

    /// Advance one frame with the measured wall-clock delta. Returns the
    /// number of fixed steps that ran.
    int tick(double rawDeltaTime);

    /// Tick with wall-clock deltas until stop() is called or keepRunning
    /// returns false.
    void run(const std::function<bool()>& keepRunning = {});

    /// Ask run() to return after the current frame. Safe from any thread.
    void stop() { m_running.store(false, std::memory_order_relaxed); }
    bool isRunning() const { return m_running.load(std::memory_order_relaxed); }

    double fixedTimestep() const { return m_fixedTimestep; }
    int maxStepsPerFrame() const { return m_maxStepsPerFrame; }

    /// Fraction of a step left in the accumulator, for render interpolation
    double alpha() const { return m_accumulator / m_fixedTimestep; }

    uint64_t frameCount() const { return m_frameCount; }
    uint64_t stepCount() const { return m_stepCount; }
    double simulatedTime() const { return m_simulatedTime; }

    /// Seconds thrown away because a frame needed more than maxStepsPerFrame
    double droppedTime() const { return m_droppedTime; }

    static constexpr double MAX_DELTA = 0.25; // Clamp to avoid spiral of death

private:
    SystemScheduler& m_scheduler;
    double m_fixedTimestep;
    int m_maxStepsPerFrame;

    double m_accumulator = 0.0;
    double m_simulatedTime = 0.0;
    double m_droppedTime = 0.0;
    uint64_t m_frameCount = 0;
    uint64_t m_stepCount = 0;
    std::atomic<bool> m_running{false};
};

} // namespace overworld
