/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameLoop.hpp"
#include "core/Logger.hpp"
#include <exception>
#include <format>

namespace Skybound {

GameLoop::GameLoop(float targetFPS, float fixedTimestep)
    : m_timestep(targetFPS, fixedTimestep) {}

bool GameLoop::run() {
    if (m_running.load(std::memory_order_relaxed)) {
        GAMELOOP_WARN("GameLoop already running");
        return false;
    }

    m_running.store(true, std::memory_order_relaxed);
    m_stopRequested.store(false, std::memory_order_relaxed);
    m_timestep.reset();

    GAMELOOP_INFO(std::format("Running at {} FPS, {} Hz updates", m_timestep.getTargetFPS(),
                              m_timestep.getUpdateFrequencyHz()));

    while (!m_stopRequested.load(std::memory_order_relaxed)) {
        m_timestep.startFrame();
        runFrame();
        m_timestep.endFrame();
    }

    m_running.store(false, std::memory_order_relaxed);
    GAMELOOP_INFO(std::format("Stopped after {} updates", m_updateCount));
    return true;
}

void GameLoop::runFrame() {
    processEvents();
    if (m_stopRequested.load(std::memory_order_relaxed)) {
        return;
    }
    processUpdates();
    processRender();
}

void GameLoop::processEvents() {
    if (!m_eventHandler) {
        return;
    }
    try {
        m_eventHandler();
    } catch (const std::exception& e) {
        GAMELOOP_ERROR(std::format("Exception in event handler: {}", e.what()));
    }
}

void GameLoop::processUpdates() {
    while (m_timestep.shouldUpdate()) {
        if (!m_updateHandler) {
            continue;
        }
        try {
            m_updateHandler(m_timestep.getUpdateDeltaTime());
        } catch (const std::exception& e) {
            GAMELOOP_ERROR(std::format("Exception in update handler: {}", e.what()));
        }
        ++m_updateCount;
        if (m_stopRequested.load(std::memory_order_relaxed)) {
            break;
        }
    }
}

void GameLoop::processRender() {
    if (!m_renderHandler || !m_timestep.shouldRender()) {
        return;
    }
    try {
        m_renderHandler(m_timestep.getInterpolationAlpha());
    } catch (const std::exception& e) {
        GAMELOOP_ERROR(std::format("Exception in render handler: {}", e.what()));
    }
}

} // namespace Skybound
