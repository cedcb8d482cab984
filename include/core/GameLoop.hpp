/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_LOOP_HPP
#define GAME_LOOP_HPP

#include "core/TimestepManager.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <utility>

namespace Skybound {

/**
 * Single-threaded fixed timestep loop driven by callbacks.
 *
 * Each frame: events once, then as many fixed updates as the accumulator
 * holds, then one render. Exceptions thrown by a handler are logged and the
 * loop keeps going. Pausing is the session's business; the loop always
 * ticks.
 */
class GameLoop {
public:
    using EventHandler = std::function<void()>;
    using UpdateHandler = std::function<void(float deltaTime)>;
    using RenderHandler = std::function<void(double interpolationAlpha)>;

    explicit GameLoop(float targetFPS = 60.0f, float fixedTimestep = 1.0f / 60.0f);

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;

    void setEventHandler(EventHandler handler) { m_eventHandler = std::move(handler); }
    void setUpdateHandler(UpdateHandler handler) { m_updateHandler = std::move(handler); }
    void setRenderHandler(RenderHandler handler) { m_renderHandler = std::move(handler); }

    /**
     * Blocks until stop() is called.
     * @return false if the loop was already running
     */
    bool run();

    /**
     * Runs exactly one frame. Used by run() and by headless drivers.
     */
    void runFrame();

    // Safe to call from inside any handler
    void stop() { m_stopRequested.store(true, std::memory_order_relaxed); }

    uint64_t getUpdateCount() const { return m_updateCount; }

    TimestepManager& getTimestepManager() { return m_timestep; }

private:
    TimestepManager m_timestep;

    EventHandler m_eventHandler;
    UpdateHandler m_updateHandler;
    RenderHandler m_renderHandler;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopRequested{false};
    uint64_t m_updateCount{0};

    void processEvents();
    void processUpdates();
    void processRender();
};

} // namespace Skybound

#endif // GAME_LOOP_HPP
