/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/TimestepManager.hpp"
#include <SDL3/SDL_timer.h>
#include <algorithm>

namespace Skybound {

TimestepManager::TimestepManager(float targetFPS, float fixedTimestep)
    : m_targetFPS(targetFPS > 0.0f ? targetFPS : 60.0f),
      m_fixedTimestep(fixedTimestep > 0.0f ? fixedTimestep : 1.0f / 60.0f),
      m_targetFrameTime(1.0f / m_targetFPS) {
    const auto now = Clock::now();
    m_frameStart = now;
    m_lastFrameTime = now;
}

void TimestepManager::startFrame() {
    const auto now = Clock::now();
    m_frameStart = now;

    if (m_firstFrame) {
        // Nothing measured yet; run one step so the first frame isn't empty
        m_firstFrame = false;
        m_lastFrameTime = now;
        m_accumulator = m_fixedTimestep;
        m_shouldRender = true;
        return;
    }

    const double deltaSeconds = std::chrono::duration<double>(now - m_lastFrameTime).count();
    m_lastFrameTime = now;
    advance(deltaSeconds);
}

void TimestepManager::advance(double deltaSeconds) {
    m_accumulator += std::clamp(deltaSeconds, 0.0, MAX_FRAME_DELTA);
    m_shouldRender = true;
}

bool TimestepManager::shouldUpdate() {
    if (m_accumulator >= m_fixedTimestep) {
        m_accumulator -= m_fixedTimestep;
        return true;
    }
    return false;
}

double TimestepManager::getInterpolationAlpha() const {
    return std::clamp(m_accumulator / m_fixedTimestep, 0.0, 1.0);
}

void TimestepManager::endFrame() {
    m_shouldRender = false;
    limitFrameRate();
}

void TimestepManager::reset() {
    m_accumulator = 0.0;
    m_firstFrame = true;
    m_shouldRender = true;
    const auto now = Clock::now();
    m_frameStart = now;
    m_lastFrameTime = now;
}

void TimestepManager::limitFrameRate() const {
    if (!m_softwareFrameLimiting) {
        return;
    }
    const auto frameBudget = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(m_targetFrameTime));
    const auto remaining = (m_frameStart + frameBudget) - Clock::now();
    const auto remainingNs = std::chrono::duration_cast<std::chrono::nanoseconds>(remaining).count();
    if (remainingNs > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remainingNs));
    }
}

} // namespace Skybound
