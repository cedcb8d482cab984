/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameConfig.hpp"
#include "core/GameLoop.hpp"
#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "input/KeyboardInputSource.hpp"
#include "utils/ConfigLoader.hpp"
#include "world/LevelGenerator.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace {

const int WINDOW_WIDTH{960};
const int WINDOW_HEIGHT{600};
const std::string GAME_NAME{"Skybound"};

struct LaunchOptions {
    std::string configPath{"res/skybound.json"};
    std::optional<int> level;
    std::optional<uint64_t> seed;
};

template <typename T> bool parseNumber(std::string_view text, T& out) {
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

bool parseArguments(int argc, char* argv[], LaunchOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (i + 1 >= argc) {
            SKYBOUND_ERROR("Main", std::format("Missing value for {}", arg));
            return false;
        }
        const std::string_view value(argv[++i]);

        if (arg == "--config") {
            options.configPath = std::string(value);
        } else if (arg == "--level") {
            int level = 0;
            if (!parseNumber(value, level)) {
                SKYBOUND_ERROR("Main", std::format("Invalid level '{}'", value));
                return false;
            }
            options.level = level;
        } else if (arg == "--seed") {
            uint64_t seed = 0;
            if (!parseNumber(value, seed)) {
                SKYBOUND_ERROR("Main", std::format("Invalid seed '{}'", value));
                return false;
            }
            options.seed = seed;
        } else {
            SKYBOUND_ERROR("Main", std::format("Unknown option {}", arg));
            return false;
        }
    }
    return true;
}

void setColor(SDL_Renderer* renderer, const Skybound::RenderItem& item) {
    using Skybound::EntityKind;
    switch (item.kind) {
    case EntityKind::Player:
        SDL_SetRenderDrawColor(renderer, 70, 140, 235, 255);
        break;
    case EntityKind::Enemy:
        if (static_cast<Skybound::EnemyVariant>(item.variant) ==
            Skybound::EnemyVariant::Projectile) {
            SDL_SetRenderDrawColor(renderer, 250, 230, 40, 255);
        } else {
            SDL_SetRenderDrawColor(renderer, 215, 60, 60, 255);
        }
        break;
    case EntityKind::Platform:
        SDL_SetRenderDrawColor(renderer, 110, 85, 60, 255);
        break;
    case EntityKind::PowerUp:
        if (static_cast<Skybound::PowerUpVariant>(item.variant) == Skybound::PowerUpVariant::Coin) {
            SDL_SetRenderDrawColor(renderer, 240, 200, 40, 255);
        } else {
            SDL_SetRenderDrawColor(renderer, 90, 210, 120, 255);
        }
        break;
    case EntityKind::Goal:
        SDL_SetRenderDrawColor(renderer, 245, 245, 245, 255);
        break;
    }
}

void render(SDL_Renderer* renderer, const Skybound::RenderSnapshot& snapshot) {
    SDL_SetRenderDrawColor(renderer, 135, 190, 235, 255);
    SDL_RenderClear(renderer);

    // Horizontal camera centred on the player, clamped to the level
    float cameraX = 0.0f;
    for (const auto& item : snapshot.items) {
        if (item.kind == Skybound::EntityKind::Player) {
            const float maxCamera =
                std::max(0.0f, snapshot.levelBounds.width() - static_cast<float>(WINDOW_WIDTH));
            cameraX = std::clamp(item.hitbox.center.getX() - WINDOW_WIDTH * 0.5f, 0.0f, maxCamera);
            break;
        }
    }

    for (const auto& item : snapshot.items) {
        setColor(renderer, item);
        const SDL_FRect rect{item.bounds.left() - cameraX, item.bounds.top(), item.bounds.width(),
                             item.bounds.height()};
        if (item.kind == Skybound::EntityKind::Player && snapshot.playerInvincible &&
            (snapshot.tick / 6) % 2 == 0) {
            SDL_RenderRect(renderer, &rect);
        } else {
            SDL_RenderFillRect(renderer, &rect);
        }
    }

    // Health pips
    SDL_SetRenderDrawColor(renderer, 215, 60, 60, 255);
    for (int i = 0; i < snapshot.health; ++i) {
        const SDL_FRect pip{12.0f + static_cast<float>(i) * 18.0f, 12.0f, 12.0f, 12.0f};
        SDL_RenderFillRect(renderer, &pip);
    }

    SDL_SetRenderDrawColor(renderer, 20, 20, 20, 255);
    const std::string hud = std::format("Level {} ({})  Score {}  Coins {}{}",
                                        snapshot.levelIndex, snapshot.tierName, snapshot.score,
                                        snapshot.coins,
                                        snapshot.state == Skybound::SessionState::Paused
                                            ? "  PAUSED"
                                            : snapshot.state == Skybound::SessionState::GameOver
                                                ? "  GAME OVER - press Space"
                                                : "");
    SDL_RenderDebugText(renderer, 12.0f, 32.0f, hud.c_str());

    SDL_RenderPresent(renderer);
}

} // namespace

int main(int argc, char* argv[]) {
    SKYBOUND_INFO("Main", std::format("Initializing {}", GAME_NAME));

    LaunchOptions options;
    if (!parseArguments(argc, argv, options)) {
        SKYBOUND_CRITICAL("Main", "Usage: skybound [--config path] [--level N] [--seed S]");
        return 1;
    }

    Skybound::GameConfig config = Skybound::GameConfig::defaults();
    if (!Skybound::ConfigLoader::loadFromFile(options.configPath, config)) {
        SKYBOUND_WARN("Main", std::format("Using built-in defaults, {} not loaded",
                                          options.configPath));
    }

    const uint64_t seed = options.seed.value_or(static_cast<uint64_t>(
        std::chrono::system_clock::now().time_since_epoch().count()));

    if (!SDL_Init(SDL_INIT_VIDEO)) {
        SKYBOUND_CRITICAL("Main", std::format("SDL_Init failed: {}", SDL_GetError()));
        return 1;
    }

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
    if (!SDL_CreateWindowAndRenderer(GAME_NAME.c_str(), WINDOW_WIDTH, WINDOW_HEIGHT, 0, &window,
                                     &renderer)) {
        SKYBOUND_CRITICAL("Main", std::format("Window creation failed: {}", SDL_GetError()));
        SDL_Quit();
        return 1;
    }

    int exitCode = 0;
    try {
        Skybound::GameSession session(config, seed);
        session.setEventHandler([](const Skybound::GameEvent& event) {
            SKYBOUND_DEBUG("Main", std::format("{} ({} {})", Skybound::toString(event.type),
                                               Skybound::toString(event.otherKind), event.other));
        });
        session.setSnapshotHandler([](const Skybound::ProgressSnapshot& progress) {
            SKYBOUND_INFO("Main", std::format("Progress: score {}, coins {}, level {}",
                                              progress.score, progress.coins,
                                              progress.levelReached));
        });

        if (options.level) {
            session.start(Skybound::ResumePoint{*options.level, seed});
        } else {
            session.start();
        }

        Skybound::KeyboardInputSource keyboard;
        Skybound::GameLoop loop(config.session.targetFPS, config.session.fixedTimestep);
        loop.getTimestepManager().setSoftwareFrameLimiting(!SDL_SetRenderVSync(renderer, 1));

        loop.setEventHandler([&]() {
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                keyboard.handleEvent(event);
            }
            if (keyboard.quitRequested()) {
                loop.stop();
            }
        });

        loop.setUpdateHandler([&](float /*deltaTime*/) {
            const Skybound::FrameInput input = keyboard.poll();
            if (session.getState() == Skybound::SessionState::GameOver && input.jumpPressed) {
                session.restart();
                return;
            }
            session.update(input);
        });

        loop.setRenderHandler(
            [&](double /*alpha*/) { render(renderer, session.buildRenderSnapshot()); });

        loop.run();
    } catch (const Skybound::GenerationConfigError& e) {
        SKYBOUND_CRITICAL("Main", std::format("Invalid generation config: {}", e.what()));
        exitCode = 1;
    }

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return exitCode;
}
