/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_STATE_HPP
#define GAME_STATE_HPP

#include <string>

// Forward declarations
struct SDL_Renderer;
class GameStateManager;

/**
 * @brief A screen or simulation driven by the GameStateManager
 *
 * Every state on the manager's stack is updated and rendered, bottom to top.
 * States below the top are paused while another state covers them. The
 * renderer may be null for headless runs.
 */
class GameState {
 public:
  virtual bool enter() = 0;
  virtual void update(float deltaTime) = 0;
  virtual void render(SDL_Renderer* renderer, float interpolationAlpha = 1.0f) = 0;
  virtual bool exit() = 0;

  // Called when another state is pushed on top / when it is popped again
  virtual void pause() {}
  virtual void resume() {}

  // Unique key within a manager
  virtual std::string getName() const = 0;
  virtual ~GameState() = default;

  // Set by GameStateManager when the state is registered
  void setStateManager(GameStateManager* manager) { mp_stateManager = manager; }
  GameStateManager* getStateManager() const { return mp_stateManager; }

 protected:
  GameStateManager* mp_stateManager = nullptr;
};

#endif  // GAME_STATE_HPP
