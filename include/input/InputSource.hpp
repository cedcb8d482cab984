/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INPUT_SOURCE_HPP
#define INPUT_SOURCE_HPP

#include <cstddef>
#include <utility>
#include <vector>

namespace Skybound {

/**
 * Player intent for one fixed update. Held states plus the edges the core
 * needs, so a jump or pause press is acted on exactly once.
 */
struct FrameInput {
    bool moveLeft{false};
    bool moveRight{false};
    bool jumpHeld{false};
    bool jumpPressed{false};  // went down since the previous poll
    bool pausePressed{false}; // went down since the previous poll
};

// Polled once per frame by the session
class IInputSource {
public:
    virtual ~IInputSource() = default;
    virtual FrameInput poll() = 0;
};

/**
 * Replays a fixed list of frames, then returns idle input. Used by tests
 * and for deterministic playback.
 */
class ScriptedInputSource : public IInputSource {
public:
    ScriptedInputSource() = default;
    explicit ScriptedInputSource(std::vector<FrameInput> frames) : m_frames(std::move(frames)) {}

    void push(const FrameInput& frame) { m_frames.push_back(frame); }
    void pushRepeated(const FrameInput& frame, size_t count) {
        m_frames.insert(m_frames.end(), count, frame);
    }

    FrameInput poll() override {
        if (m_cursor < m_frames.size()) {
            return m_frames[m_cursor++];
        }
        return FrameInput{};
    }

    bool exhausted() const { return m_cursor >= m_frames.size(); }

private:
    std::vector<FrameInput> m_frames;
    size_t m_cursor{0};
};

} // namespace Skybound

#endif // INPUT_SOURCE_HPP
