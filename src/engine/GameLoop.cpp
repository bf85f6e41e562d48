#include "engine/GameLoop.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <chrono>

namespace overworld {

GameLoop::GameLoop(SystemScheduler& scheduler, double fixedTimestep, int maxStepsPerFrame)
    : m_scheduler(scheduler)
    , m_fixedTimestep(fixedTimestep > 0.0 ? fixedTimestep : 1.0 / 60.0)
    , m_maxStepsPerFrame(maxStepsPerFrame > 0 ? maxStepsPerFrame : 1) {
    if (fixedTimestep <= 0.0 || maxStepsPerFrame <= 0) {
        LOG_WARN("GameLoop: invalid timestep {} / max steps {}, using {} / {}",
                 fixedTimestep, maxStepsPerFrame, m_fixedTimestep, m_maxStepsPerFrame);
    }
}

int GameLoop::tick(double rawDeltaTime) {
    double dt = std::clamp(rawDeltaTime, 0.0, MAX_DELTA);
    m_accumulator += dt;

    const float step = static_cast<float>(m_fixedTimestep);
    int steps = 0;
    while (m_accumulator >= m_fixedTimestep && steps < m_maxStepsPerFrame) {
        m_scheduler.update(step);
        m_accumulator -= m_fixedTimestep;
        m_simulatedTime += m_fixedTimestep;
        ++steps;
    }

    // Still behind after the step budget: drop whole steps, keep the remainder
    if (m_accumulator >= m_fixedTimestep) {
        double whole = static_cast<double>(static_cast<int64_t>(m_accumulator / m_fixedTimestep));
        m_droppedTime += whole * m_fixedTimestep;
        m_accumulator -= whole * m_fixedTimestep;
        LOG_DEBUG("GameLoop: dropped {:.3f}s of simulation", whole * m_fixedTimestep);
    }

    m_scheduler.render(static_cast<float>(dt));
    m_stepCount += static_cast<uint64_t>(steps);
    ++m_frameCount;
    return steps;
}

void GameLoop::run(const std::function<bool()>& keepRunning) {
    using Clock = std::chrono::steady_clock;

    m_running.store(true, std::memory_order_relaxed);
    LOG_INFO("Entering main loop (step {:.4f}s, max {} steps/frame)", m_fixedTimestep, m_maxStepsPerFrame);

    auto last = Clock::now();
    while (isRunning() && (!keepRunning || keepRunning())) {
        auto now = Clock::now();
        double dt = std::chrono::duration<double>(now - last).count();
        last = now;
        tick(dt);
    }

    m_running.store(false, std::memory_order_relaxed);
    LOG_INFO("Main loop exited after {} frames", m_frameCount);
}

} // namespace overworld
