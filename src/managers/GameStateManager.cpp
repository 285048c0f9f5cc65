/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/GameStateManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

GameStateManager::GameStateManager() {
  m_registeredStates.reserve(8);
  m_activeStates.reserve(4);
}

GameStateManager::~GameStateManager() {
  clearAllStates();
}

void GameStateManager::addState(std::unique_ptr<GameState> state) {
  if (!state) {
    GAMESTATE_ERROR("Attempted to add a null state");
    throw std::invalid_argument("Lattice Engine - Attempted to add a null state");
  }
  std::string name = state->getName();
  if (hasState(name)) {
    GAMESTATE_ERROR(std::format("State with name {} already exists", name));
    throw std::runtime_error(
        std::format("Lattice Engine - State with name {} already exists", name));
  }
  state->setStateManager(this);
  GAMESTATE_DEBUG(std::format("Registered state: {}", name));
  m_registeredStates.emplace(std::move(name), std::shared_ptr<GameState>(std::move(state)));
}

bool GameStateManager::pushState(const std::string& stateName) {
  auto it = m_registeredStates.find(stateName);
  if (it == m_registeredStates.end()) {
    GAMESTATE_ERROR(std::format("pushState: state not found: {}", stateName));
    return false;
  }
  if (isStateActive(stateName)) {
    GAMESTATE_WARN(std::format("pushState: {} is already on the stack", stateName));
    return false;
  }

  if (!m_activeStates.empty()) {
    m_activeStates.back()->pause();
  }
  m_activeStates.push_back(it->second);
  if (!m_activeStates.back()->enter()) {
    GAMESTATE_WARN(std::format("State {} reported a failed enter()", stateName));
  }
  GAMESTATE_INFO(std::format("Pushed state: {} (depth {})", stateName, m_activeStates.size()));
  return true;
}

bool GameStateManager::popState() {
  if (m_activeStates.empty()) {
    return false;
  }

  // Keep the state alive until exit() returns
  std::shared_ptr<GameState> top = m_activeStates.back();
  m_activeStates.pop_back();
  exitState(*top);
  GAMESTATE_INFO(std::format("Popped state: {}", top->getName()));

  if (!m_activeStates.empty()) {
    m_activeStates.back()->resume();
  }
  return true;
}

bool GameStateManager::changeState(const std::string& stateName) {
  if (!hasState(stateName)) {
    GAMESTATE_ERROR(std::format("changeState: state not found: {}", stateName));
    return false;
  }
  popState();
  return pushState(stateName);
}

void GameStateManager::update(float deltaTime) {
  // Snapshot: a state may push or pop from inside its update
  const auto activeStates = m_activeStates;
  for (const auto& state : activeStates) {
    state->update(deltaTime);
  }
}

void GameStateManager::render(SDL_Renderer* renderer, float interpolationAlpha) {
  const auto activeStates = m_activeStates;
  for (const auto& state : activeStates) {
    state->render(renderer, interpolationAlpha);
  }
}

bool GameStateManager::hasState(const std::string& stateName) const {
  return m_registeredStates.find(stateName) != m_registeredStates.end();
}

std::shared_ptr<GameState> GameStateManager::getState(const std::string& stateName) const {
  auto it = m_registeredStates.find(stateName);
  return it != m_registeredStates.end() ? it->second : nullptr;
}

std::shared_ptr<GameState> GameStateManager::getCurrentState() const {
  return m_activeStates.empty() ? nullptr : m_activeStates.back();
}

bool GameStateManager::isStateActive(const std::string& stateName) const {
  return std::any_of(m_activeStates.begin(), m_activeStates.end(),
                     [&](const std::shared_ptr<GameState>& state) {
                       return state->getName() == stateName;
                     });
}

bool GameStateManager::removeState(const std::string& stateName) {
  auto registered = m_registeredStates.find(stateName);
  if (registered == m_registeredStates.end()) {
    GAMESTATE_WARN(std::format("removeState: state not found: {}", stateName));
    return false;
  }
  std::shared_ptr<GameState> state = registered->second;

  auto active = std::find(m_activeStates.begin(), m_activeStates.end(), state);
  if (active != m_activeStates.end()) {
    const bool wasTop = std::next(active) == m_activeStates.end();
    m_activeStates.erase(active);
    exitState(*state);
    if (wasTop && !m_activeStates.empty()) {
      m_activeStates.back()->resume();
    }
  }

  m_registeredStates.erase(registered);
  GAMESTATE_INFO(std::format("Removed state: {}", stateName));
  return true;
}

void GameStateManager::clearAllStates() {
  while (!m_activeStates.empty()) {
    std::shared_ptr<GameState> top = m_activeStates.back();
    m_activeStates.pop_back();
    exitState(*top);
  }
  m_registeredStates.clear();
}

void GameStateManager::exitState(GameState& state) {
  if (!state.exit()) {
    GAMESTATE_WARN(std::format("State {} reported a failed exit()", state.getName()));
  }
}
