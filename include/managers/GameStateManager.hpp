/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_STATE_MANAGER_HPP
#define GAME_STATE_MANAGER_HPP

#include "gameStates/GameState.hpp"
#include <boost/container/flat_map.hpp>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Registry of named game states plus the stack of running ones
 *
 * Pushing a state pauses the one it covers; popping resumes it. Every state
 * on the stack is updated and rendered, bottom first, so a paused
 * SimulationState under an overlay still draws but does not advance.
 */
class GameStateManager {
 public:
  GameStateManager();
  ~GameStateManager();

  GameStateManager(const GameStateManager&) = delete;
  GameStateManager& operator=(const GameStateManager&) = delete;

  /**
   * @throws std::invalid_argument for a null state
   * @throws std::runtime_error if a state with the same name is registered
   */
  void addState(std::unique_ptr<GameState> state);

  // false (logged) if no state has that name
  bool pushState(const std::string& stateName);
  bool popState();

  // Pops the top state, if any, and pushes stateName
  bool changeState(const std::string& stateName);

  void update(float deltaTime);
  void render(SDL_Renderer* renderer, float interpolationAlpha = 1.0f);

  bool hasState(const std::string& stateName) const;
  std::shared_ptr<GameState> getState(const std::string& stateName) const;
  std::shared_ptr<GameState> getCurrentState() const;
  size_t getActiveStateCount() const { return m_activeStates.size(); }
  bool isStateActive(const std::string& stateName) const;

  // Exits the state if it is on the stack, then unregisters it
  bool removeState(const std::string& stateName);

  // Exits the stack top-down and unregisters everything
  void clearAllStates();

 private:
  void exitState(GameState& state);

  boost::container::flat_map<std::string, std::shared_ptr<GameState>> m_registeredStates{};
  std::vector<std::shared_ptr<GameState>> m_activeStates{};
};

#endif  // GAME_STATE_MANAGER_HPP
