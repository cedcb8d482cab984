/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef KEYBOARD_INPUT_SOURCE_HPP
#define KEYBOARD_INPUT_SOURCE_HPP

#include "input/InputSource.hpp"
#include <SDL3/SDL.h>
#include <boost/container/small_vector.hpp>

namespace Skybound {

/**
 * SDL keyboard mapped to FrameInput.
 *
 * Arrows or A/D move, Space (or Up/W) jumps, Escape or P toggles pause.
 * Held keys come from SDL's keyboard state at poll time; presses are
 * collected from key-down events so a tap shorter than a frame still counts.
 */
class KeyboardInputSource : public IInputSource {
public:
    KeyboardInputSource() = default;

    // Feed every SDL event from the host's event pump
    void handleEvent(const SDL_Event& event);

    FrameInput poll() override;

    bool quitRequested() const { return m_quitRequested; }

private:
    boost::container::small_vector<SDL_Scancode, 8> m_pressedThisFrame;
    bool m_quitRequested{false};

    bool wasPressed(SDL_Scancode key) const;
};

} // namespace Skybound

#endif // KEYBOARD_INPUT_SOURCE_HPP
