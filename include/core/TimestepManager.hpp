/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>

namespace Skybound {

/**
 * Fixed timestep accumulator for the simulation plus frame pacing for the
 * host.
 *
 * Wall-clock time is added to an accumulator each frame (clamped so a long
 * stall can't trigger a spiral of catch-up updates) and drained in whole
 * fixed steps by shouldUpdate(). Rendering happens once per frame.
 */
class TimestepManager {
public:
    /**
     * @param targetFPS frame rate the host paces itself to
     * @param fixedTimestep simulation step in seconds
     */
    explicit TimestepManager(float targetFPS = 60.0f, float fixedTimestep = 1.0f / 60.0f);

    // Measures elapsed wall time since the previous frame
    void startFrame();

    // Feeds an explicit frame duration instead of the clock (replays and tests)
    void advance(double deltaSeconds);

    // True while at least one fixed step is pending; consumes it
    bool shouldUpdate();
    bool shouldRender() const { return m_shouldRender; }

    float getUpdateDeltaTime() const { return m_fixedTimestep; }

    // Fraction of the next step already accumulated, in [0, 1]
    double getInterpolationAlpha() const;

    // Marks the frame rendered and sleeps off the rest of the frame budget
    void endFrame();

    float getTargetFPS() const { return m_targetFPS; }
    float getUpdateFrequencyHz() const { return 1.0f / m_fixedTimestep; }

    // Hardware vsync paces frames itself; software limiting sleeps in endFrame()
    void setSoftwareFrameLimiting(bool enabled) { m_softwareFrameLimiting = enabled; }

    // Drops accumulated time; the next startFrame() runs a single step
    void reset();

    static constexpr double MAX_FRAME_DELTA = 0.25;

private:
    using Clock = std::chrono::steady_clock;

    float m_targetFPS;
    float m_fixedTimestep;
    float m_targetFrameTime;

    Clock::time_point m_frameStart;
    Clock::time_point m_lastFrameTime;

    double m_accumulator{0.0};

    bool m_shouldRender{true};
    bool m_firstFrame{true};
    bool m_softwareFrameLimiting{true};

    void limitFrameRate() const;
};

} // namespace Skybound

#endif // TIMESTEP_MANAGER_HPP
