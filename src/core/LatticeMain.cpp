/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "core/SimulationConfig.hpp"
#include "core/TimestepManager.hpp"
#include "gameStates/SimulationState.hpp"
#include "managers/GameStateManager.hpp"
#include "managers/SettingsManager.hpp"
#include "render/ShapeRenderer.hpp"
#include "sim/NodeBehavior.hpp"
#include <SDL3/SDL.h>
#include <cmath>
#include <exception>
#include <format>
#include <memory>
#include <string>
#include <vector>

#ifndef LATTICE_APP_NAME
#define LATTICE_APP_NAME "Lattice Engine"
#endif

using namespace LatticeEngine;

namespace {

const std::string APP_NAME{LATTICE_APP_NAME};
const std::string DEMO_STATE{"DemoState"};
constexpr int ORBITER_COUNT{12};

// Moves its shape around a circle, one step per tick
class OrbiterBehavior : public NodeBehavior {
 public:
  OrbiterBehavior(ShapeHandle shape, const Vector2D& center, float radius, float step)
      : m_shape(shape), m_center(center), m_radius(radius), m_step(step) {}

  void onAdded(SimulationState& state, NodeHandle) override {
    state.addShape(m_shape);
  }

  void onRemoved(SimulationState& state, NodeHandle) override {
    state.removeShape(m_shape);
  }

  void onTick(SimulationState& state, NodeHandle) override {
    m_angle += m_step;
    const Vector2D position(m_center.getX() + m_radius * std::cos(m_angle),
                            m_center.getY() + m_radius * std::sin(m_angle));
    const Vector2D halfSize = state.getShape(m_shape).bounds.size() / 2.0f;
    state.setShapeBounds(m_shape, AABB::fromCenter(position, halfSize));
  }

  std::string getName() const override { return "Orbiter"; }

 private:
  ShapeHandle m_shape;
  Vector2D m_center;
  float m_radius;
  float m_step;
  float m_angle{0.0f};
};

// Child node that flips its orbiter's shape between two draw layers
class BlinkerBehavior : public NodeBehavior {
 public:
  BlinkerBehavior(ShapeHandle shape, int period)
      : m_shape(shape),
        m_period(period),
        m_event(std::make_shared<TimedEvent>([this]() { m_due = true; }, "Blink")) {}

  void onAdded(SimulationState& state, NodeHandle self) override {
    state.getScheduler().setTimer(self, m_event, m_period);
  }

  void onRemoved(SimulationState& state, NodeHandle self) override {
    state.getScheduler().setTimer(self, m_event, -1);
  }

  // Timers fire before the tick hook, so a due blink is handled this tick
  void onTick(SimulationState& state, NodeHandle self) override {
    if (!m_due) {
      return;
    }
    m_due = false;
    const int layer = state.getShape(m_shape).drawLayer;
    state.setShapeDrawLayer(m_shape, layer == 1 ? 2 : 1);
    state.getScheduler().setTimer(self, m_event, m_period);
  }

  std::string getName() const override { return "Blinker"; }

 private:
  ShapeHandle m_shape;
  int m_period;
  TimedEventPtr m_event;
  bool m_due{false};
};

void populateDemo(SimulationState& state, const SimulationConfig& config) {
  NodeScheduler& scheduler = state.getScheduler();
  const Vector2D center(static_cast<float>(config.windowWidth) / 2.0f,
                        static_cast<float>(config.windowHeight) / 2.0f);

  // Static backdrop tiles behind everything
  for (int y = -2; y <= 2; ++y) {
    for (int x = -3; x <= 3; ++x) {
      const Vector2D tileCenter(center.getX() + static_cast<float>(x) * 200.0f,
                                center.getY() + static_cast<float>(y) * 200.0f);
      const ShapeHandle tile =
          state.createShape(AABB::fromCenter(tileCenter, Vector2D(90.0f, 90.0f)), -1);
      state.setShapeRole(tile, HitboxRole::Locator, true);
      state.addShape(tile);
    }
  }

  const ShapeHandle camera =
      state.createShape(AABB::fromCenter(center, Vector2D(1.0f, 1.0f)), 0);

  for (int i = 0; i < ORBITER_COUNT; ++i) {
    const float radius = 80.0f + 25.0f * static_cast<float>(i);
    const ShapeHandle shape =
        state.createShape(AABB::fromCenter(center, Vector2D(12.0f, 12.0f)), 1);
    state.setShapeRole(shape, HitboxRole::Locator, true);
    state.setShapeRole(shape, i % 3 == 0 ? HitboxRole::Solid : HitboxRole::Overlap, true);

    const NodeHandle orbiter = scheduler.createNode(std::make_unique<OrbiterBehavior>(
        shape, center, radius, 0.01f + 0.002f * static_cast<float>(i)));
    scheduler.setPriority(orbiter, ORBITER_COUNT - i);
    scheduler.attach(orbiter);

    if (i % 2 == 0) {
      const NodeHandle blinker =
          scheduler.createNode(std::make_unique<BlinkerBehavior>(shape, 30 + 10 * i));
      scheduler.attach(blinker, orbiter);
    }
    if (i == ORBITER_COUNT / 2) {
      // Half speed, independent of the state's factor
      scheduler.setTimeFactor(orbiter, Frac::UNIT / 2);
    }
  }

  // Camera follows the first orbiter
  auto follow = std::make_unique<CallbackBehavior>("CameraFollow");
  follow->frame = [camera](SimulationState& s, NodeHandle) {
    std::vector<ShapeHandle> solids;
    s.queryShapes(HitboxRole::Solid, AABB(-1.0e6f, -1.0e6f, 1.0e6f, 1.0e6f), solids);
    if (!solids.empty()) {
      const Vector2D target = s.getShape(solids.front()).bounds.center();
      s.setShapeBounds(camera, AABB::fromCenter(target, Vector2D(1.0f, 1.0f)));
    }
  };
  const NodeHandle follower = scheduler.createNode(std::move(follow));
  scheduler.setPriority(follower, -100);
  scheduler.attach(follower);

  const float w = static_cast<float>(config.windowWidth);
  const float h = static_cast<float>(config.windowHeight);
  state.setViewport(0, Viewport{0.0f, 0.0f, w, h, ShapeHandle{}});
  state.setViewport(1, Viewport{w * 0.7f, h * 0.05f, w * 0.95f, h * 0.35f, camera});
  state.setRenderCallback(&ShapeRenderer::draw);
  state.setRenderLayer(1, [](const RenderView& view) {
    SDL_Renderer* renderer = view.getRenderer();
    if (!renderer) {
      return;
    }
    const Viewport& vp = view.getViewport();
    const SDL_FRect frame{vp.x1, vp.y1, vp.width(), vp.height()};
    SDL_SetRenderDrawColor(renderer, 240, 240, 240, 255);
    SDL_RenderRect(renderer, &frame);
  });
}

bool handleEvents(SimulationState& state) {
  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    if (event.type == SDL_EVENT_QUIT) {
      return false;
    }
    if (event.type != SDL_EVENT_KEY_DOWN) {
      continue;
    }
    switch (event.key.key) {
      case SDLK_ESCAPE:
        return false;
      case SDLK_SPACE:
        if (state.isActive()) {
          state.pause();
        } else {
          state.resume();
        }
        break;
      case SDLK_UP:
        state.setTimeFactor(state.getTimeFactor() * 2);
        GAMELOOP_INFO(std::format("Time factor {}", Frac::toDouble(state.getTimeFactor())));
        break;
      case SDLK_DOWN:
        state.setTimeFactor(state.getTimeFactor() / 2);
        GAMELOOP_INFO(std::format("Time factor {}", Frac::toDouble(state.getTimeFactor())));
        break;
      default:
        break;
    }
  }
  return true;
}

}  // namespace

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  GAMELOOP_INFO(std::format("Initializing {}", APP_NAME));

  if (!SDL_Init(SDL_INIT_VIDEO)) {
    GAMELOOP_CRITICAL(std::format("SDL_Init failed: {}", SDL_GetError()));
    return -1;
  }

  if (char* prefPath = SDL_GetPrefPath("HammerForgedGames", LATTICE_APP_NAME)) {
    Logger::SetLogDirectory(prefPath);
    SDL_free(prefPath);
  }

  auto& settings = SettingsManager::Instance();
  if (!settings.loadFromFile("res/settings.json")) {
    GAMELOOP_WARN("Failed to load settings.json - using defaults");
  }
  const SimulationConfig config = SimulationConfig::fromSettings();

  SDL_Window* window =
      SDL_CreateWindow(APP_NAME.c_str(), config.windowWidth, config.windowHeight, 0);
  if (!window) {
    GAMELOOP_CRITICAL(std::format("Window creation failed: {}", SDL_GetError()));
    SDL_Quit();
    return -1;
  }
  SDL_Renderer* renderer = SDL_CreateRenderer(window, nullptr);
  if (!renderer) {
    GAMELOOP_CRITICAL(std::format("Renderer creation failed: {}", SDL_GetError()));
    SDL_DestroyWindow(window);
    SDL_Quit();
    return -1;
  }

  TimestepManager timestep(static_cast<float>(config.targetFPS));
  const bool vsync = settings.get<bool>("host", "vsync", true);
  if (!vsync || !SDL_SetRenderVSync(renderer, 1)) {
    GAMELOOP_INFO("Using software frame limiting");
    timestep.setSoftwareFrameLimiting(true);
  }

  int exitCode = 0;
  try {
    GameStateManager stateManager;
    auto demo = std::make_unique<SimulationState>(DEMO_STATE, config);
    SimulationState& state = *demo;
    populateDemo(state, config);
    stateManager.addState(std::move(demo));
    stateManager.pushState(DEMO_STATE);

    GAMELOOP_INFO("Starting Main Loop");
    while (handleEvents(state)) {
      timestep.startFrame();

      stateManager.update(static_cast<float>(timestep.getDeltaSeconds()));

      SDL_SetRenderDrawColor(renderer, 31, 32, 34, 255);
      SDL_RenderClear(renderer);
      stateManager.render(renderer);
      SDL_RenderPresent(renderer);

      if (timestep.isFrameTimeExcessive()) {
        GAMELOOP_DEBUG(std::format("Slow frame: {}ms", timestep.getFrameTimeMs()));
      }
      timestep.endFrame();
    }

    stateManager.clearAllStates();
  } catch (const std::exception& e) {
    GAMELOOP_ERROR(std::format("Simulation aborted: {}", e.what()));
    exitCode = -1;
  }

  GAMELOOP_INFO(std::format("{} shutting down", APP_NAME));
  SDL_DestroyRenderer(renderer);
  SDL_DestroyWindow(window);
  SDL_Quit();
  return exitCode;
}
