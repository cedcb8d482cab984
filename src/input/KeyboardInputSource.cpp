/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "input/KeyboardInputSource.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace Skybound {

void KeyboardInputSource::handleEvent(const SDL_Event& event) {
    switch (event.type) {
    case SDL_EVENT_QUIT:
        INPUT_INFO("Quit requested");
        m_quitRequested = true;
        break;
    case SDL_EVENT_KEY_DOWN:
        if (event.key.repeat) {
            break;
        }
        if (!wasPressed(event.key.scancode)) {
            m_pressedThisFrame.push_back(event.key.scancode);
        }
        break;
    default:
        break;
    }
}

FrameInput KeyboardInputSource::poll() {
    int keyCount = 0;
    const bool* keys = SDL_GetKeyboardState(&keyCount);
    auto held = [keys, keyCount](SDL_Scancode key) {
        return keys && static_cast<int>(key) < keyCount && keys[key];
    };

    FrameInput input;
    input.moveLeft = held(SDL_SCANCODE_LEFT) || held(SDL_SCANCODE_A);
    input.moveRight = held(SDL_SCANCODE_RIGHT) || held(SDL_SCANCODE_D);
    input.jumpHeld = held(SDL_SCANCODE_SPACE) || held(SDL_SCANCODE_UP) || held(SDL_SCANCODE_W);
    input.jumpPressed = wasPressed(SDL_SCANCODE_SPACE) || wasPressed(SDL_SCANCODE_UP) ||
                        wasPressed(SDL_SCANCODE_W);
    input.pausePressed = wasPressed(SDL_SCANCODE_ESCAPE) || wasPressed(SDL_SCANCODE_P);

    m_pressedThisFrame.clear();
    return input;
}

bool KeyboardInputSource::wasPressed(SDL_Scancode key) const {
    return std::any_of(m_pressedThisFrame.begin(), m_pressedThisFrame.end(),
                       [key](SDL_Scancode pressed) { return pressed == key; });
}

} // namespace Skybound
