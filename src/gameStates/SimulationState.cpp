/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "gameStates/SimulationState.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

using namespace LatticeEngine;

SimulationState::SimulationState(std::string name, const SimulationConfig& config)
    : m_name(std::move(name)),
      m_scheduler(*this, m_changes),
      m_chunkIndex(config.chunkWidth, config.chunkHeight),
      m_frameScaler(config.nominalFrameSeconds),
      m_timeFactor(Frac::fromDouble(config.timeFactor)) {
  if (m_timeFactor < 0) {
    SIMSTATE_ERROR(std::format("Negative time factor {} in config", config.timeFactor));
    throw std::invalid_argument("Lattice Engine - State time factor must not be negative");
  }
}

SimulationState::~SimulationState() {
  // Unhook every shape before the arena goes away
  m_chunkIndex.clear();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

bool SimulationState::enter() {
  SIMSTATE_INFO("Entering " + m_name);
  m_entered = true;
  m_paused = false;
  m_frameScaler.reset();
  return true;
}

bool SimulationState::exit() {
  SIMSTATE_INFO("Exiting " + m_name);
  m_entered = false;
  m_paused = false;
  return true;
}

void SimulationState::pause() {
  SIMSTATE_DEBUG("Pausing " + m_name);
  m_paused = true;
}

void SimulationState::resume() {
  SIMSTATE_DEBUG("Resuming " + m_name);
  m_paused = false;
}

void SimulationState::update(float deltaTime) {
  advanceFrame(static_cast<double>(deltaTime));
}

void SimulationState::setTimeFactor(Frac::Value timeFactor) {
  if (timeFactor < 0) {
    SIMSTATE_ERROR(std::format("Attempted to set a negative time factor ({})", timeFactor));
    throw std::invalid_argument("Lattice Engine - State time factor must not be negative");
  }
  m_timeFactor = timeFactor;
}

// ---------------------------------------------------------------------------
// Frame driver
// ---------------------------------------------------------------------------

void SimulationState::advanceFrame(double deltaSeconds) {
  if (!isActive()) {
    return;
  }

  const Frac::Value frameScale = m_frameScaler.convert(deltaSeconds);
  m_scheduler.endFrame();

  updateAnimations(frameScale);

  const int ticks = m_scheduler.advanceClocks(frameScale);
  int pass = 0;
  for (; pass < ticks && isActive(); ++pass) {
    {
      PendingChanges::Scope scope(m_changes);
      m_scheduler.runTickPass(pass);
    }
    flushChanges();
  }
  if (pass < ticks) {
    // Stopped mid-frame; the remaining ticks run once the state is active again
    m_scheduler.refundTicks(pass);
  }

  if (isActive()) {
    {
      PendingChanges::Scope scope(m_changes);
      m_scheduler.runFramePass();
    }
    flushChanges();
  }

  m_scheduler.endFrame();
  ++m_frameCount;
}

void SimulationState::flushChanges() {
  // Applying a change can run hooks that queue more; loop until quiet
  PendingChanges::Scope scope(m_changes);
  while (!m_changes.empty()) {
    while (!m_changes.empty()) {
      for (const StructuralChange& change : m_changes.drain()) {
        applyChange(change);
      }
    }
    m_scheduler.catchUpNewNodes();
  }
}

void SimulationState::applyChange(const StructuralChange& change) {
  if (m_scheduler.applyChange(change)) {
    return;
  }
  switch (change.type) {
    case StructuralChange::Type::AddShape:
      applyAddShape(change.shape);
      break;
    case StructuralChange::Type::RemoveShape:
      applyRemoveShape(change.shape);
      break;
    case StructuralChange::Type::DestroyShape:
      freeShape(change.shape);
      break;
    default:
      SIMSTATE_WARN("Ignoring unknown structural change");
      break;
  }
}

void SimulationState::updateAnimations(Frac::Value frameScale) {
  // Copy: removing an animation must not disturb this frame's iteration
  const auto animations = m_animations;
  for (const auto& animation : animations) {
    const Frac::Value factor =
        animation->getTimeFactor() < 0 ? m_timeFactor : animation->getTimeFactor();
    animation->advance(factor, frameScale);
  }
}

// ---------------------------------------------------------------------------
// Shapes
// ---------------------------------------------------------------------------

ShapeHandle SimulationState::createShape(const AABB& bounds, int drawLayer) {
  if (!bounds.isValid()) {
    SIMSTATE_ERROR(std::format("createShape: inverted bounds ({}, {})-({}, {})",
                               bounds.x1, bounds.y1, bounds.x2, bounds.y2));
    throw std::invalid_argument("Lattice Engine - Shape bounds must not be inverted");
  }
  uint32_t index;
  if (!m_freeShapeSlots.empty()) {
    index = m_freeShapeSlots.back();
    m_freeShapeSlots.pop_back();
  } else {
    index = static_cast<uint32_t>(m_shapes.size());
    m_shapes.emplace_back();
  }

  ShapeSlot& slot = m_shapes[index];
  slot.record = ShapeRecord{};
  slot.alive = true;
  const ShapeHandle handle{index, slot.generation};
  slot.record.hitbox.id = handle;
  slot.record.hitbox.bounds = bounds;
  slot.record.hitbox.drawLayer = drawLayer;
  ++m_liveShapes;
  return handle;
}

bool SimulationState::isShapeAlive(ShapeHandle shape) const {
  if (!shape.isValid() || shape.index >= m_shapes.size()) {
    return false;
  }
  const ShapeSlot& slot = m_shapes[shape.index];
  return slot.alive && slot.generation == shape.generation;
}

SimulationState::ShapeRecord& SimulationState::shapeRecord(ShapeHandle shape,
                                                           const char* operation) {
  if (!isShapeAlive(shape)) {
    SIMSTATE_ERROR(std::format("{}: stale or invalid shape {}", operation, shape.toString()));
    throw std::out_of_range(std::format("Lattice Engine - {}: stale or invalid shape {}",
                                        operation, shape.toString()));
  }
  return m_shapes[shape.index].record;
}

const SimulationState::ShapeRecord& SimulationState::shapeRecord(ShapeHandle shape,
                                                                 const char* operation) const {
  if (!isShapeAlive(shape)) {
    SIMSTATE_ERROR(std::format("{}: stale or invalid shape {}", operation, shape.toString()));
    throw std::out_of_range(std::format("Lattice Engine - {}: stale or invalid shape {}",
                                        operation, shape.toString()));
  }
  return m_shapes[shape.index].record;
}

bool SimulationState::destroyShape(ShapeHandle shape) {
  if (!isShapeAlive(shape)) {
    return false;
  }
  ShapeRecord& record = m_shapes[shape.index].record;
  if (record.destroyPending) {
    return false;
  }

  if (m_changes.isDeferring()) {
    record.destroyPending = true;
    record.pendingInState = false;
    m_changes.push(StructuralChange{StructuralChange::Type::DestroyShape, NodeHandle{},
                                    GroupRef{}, shape});
    return true;
  }

  freeShape(shape);
  return true;
}

void SimulationState::freeShape(ShapeHandle shape) {
  if (!isShapeAlive(shape)) {
    return;
  }
  ShapeSlot& slot = m_shapes[shape.index];
  m_chunkIndex.removeAllRoles(slot.record.hitbox);
  slot.record = ShapeRecord{};
  slot.alive = false;
  if (++slot.generation == ShapeHandle::INVALID_GENERATION) {
    slot.generation = 1;
  }
  m_freeShapeSlots.push_back(shape.index);
  --m_liveShapes;
}

bool SimulationState::addShape(ShapeHandle shape) {
  ShapeRecord& record = shapeRecord(shape, "addShape");
  if (record.pendingInState || record.destroyPending) {
    return false;
  }

  record.pendingInState = true;
  if (m_changes.isDeferring()) {
    m_changes.push(StructuralChange{StructuralChange::Type::AddShape, NodeHandle{},
                                    GroupRef{}, shape});
  } else {
    applyAddShape(shape);
  }
  return true;
}

bool SimulationState::removeShape(ShapeHandle shape) {
  ShapeRecord& record = shapeRecord(shape, "removeShape");
  if (!record.pendingInState) {
    return false;
  }

  record.pendingInState = false;
  if (m_changes.isDeferring()) {
    m_changes.push(StructuralChange{StructuralChange::Type::RemoveShape, NodeHandle{},
                                    GroupRef{}, shape});
  } else {
    applyRemoveShape(shape);
  }
  return true;
}

void SimulationState::applyAddShape(ShapeHandle shape) {
  if (!isShapeAlive(shape)) {
    return;
  }
  ShapeRecord& record = m_shapes[shape.index].record;
  if (record.inState || !record.pendingInState) {
    return;
  }

  record.inState = true;
  for (size_t r = 0; r < HITBOX_ROLE_COUNT; ++r) {
    if (record.requestedRoles[r]) {
      m_chunkIndex.addRole(record.hitbox, static_cast<HitboxRole>(r));
    }
  }
}

void SimulationState::applyRemoveShape(ShapeHandle shape) {
  if (!isShapeAlive(shape)) {
    return;
  }
  ShapeRecord& record = m_shapes[shape.index].record;
  if (!record.inState || record.pendingInState) {
    return;
  }

  record.inState = false;
  m_chunkIndex.removeAllRoles(record.hitbox);
}

bool SimulationState::isShapeInState(ShapeHandle shape) const {
  return shapeRecord(shape, "isShapeInState").inState;
}

void SimulationState::setShapeBounds(ShapeHandle shape, const AABB& bounds) {
  ShapeRecord& record = shapeRecord(shape, "setShapeBounds");
  if (!bounds.isValid()) {
    SIMSTATE_ERROR(std::format("setShapeBounds: inverted bounds ({}, {})-({}, {})",
                               bounds.x1, bounds.y1, bounds.x2, bounds.y2));
    throw std::invalid_argument("Lattice Engine - Shape bounds must not be inverted");
  }
  record.hitbox.bounds = bounds;
  m_chunkIndex.updateChunks(record.hitbox);
}

bool SimulationState::setShapeRole(ShapeHandle shape, HitboxRole role, bool active) {
  ShapeRecord& record = shapeRecord(shape, "setShapeRole");
  bool& requested = record.requestedRoles[roleIndex(role)];
  if (requested == active) {
    return false;
  }

  requested = active;
  if (record.inState) {
    if (active) {
      m_chunkIndex.addRole(record.hitbox, role);
    } else {
      m_chunkIndex.removeRole(record.hitbox, role);
    }
  }
  return true;
}

bool SimulationState::getShapeRole(ShapeHandle shape, HitboxRole role) const {
  return shapeRecord(shape, "getShapeRole").requestedRoles[roleIndex(role)];
}

void SimulationState::setShapeDrawLayer(ShapeHandle shape, int drawLayer) {
  ShapeRecord& record = shapeRecord(shape, "setShapeDrawLayer");
  m_chunkIndex.changeDrawLayer(record.hitbox, drawLayer);
}

const Hitbox& SimulationState::getShape(ShapeHandle shape) const {
  return shapeRecord(shape, "getShape").hitbox;
}

void SimulationState::queryShapes(HitboxRole role, const AABB& region,
                                  std::vector<ShapeHandle>& out) const {
  std::vector<const Hitbox*> hits;
  m_chunkIndex.query(role, region, hits);
  out.reserve(out.size() + hits.size());
  for (const Hitbox* hitbox : hits) {
    out.push_back(hitbox->id);
  }
}

void SimulationState::setChunkDimensions(float chunkWidth, float chunkHeight) {
  m_chunkIndex.setChunkDimensions(chunkWidth, chunkHeight);
}

// ---------------------------------------------------------------------------
// Animations
// ---------------------------------------------------------------------------

bool SimulationState::addAnimation(std::shared_ptr<AnimationInstance> animation) {
  if (!animation ||
      std::find(m_animations.begin(), m_animations.end(), animation) != m_animations.end()) {
    return false;
  }
  m_animations.push_back(std::move(animation));
  return true;
}

bool SimulationState::removeAnimation(const std::shared_ptr<AnimationInstance>& animation) {
  auto it = std::find(m_animations.begin(), m_animations.end(), animation);
  if (it == m_animations.end()) {
    return false;
  }
  m_animations.erase(it);
  return true;
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

void SimulationState::setViewport(int id, const Viewport& viewport) {
  m_viewports[id] = viewport;
}

bool SimulationState::removeViewport(int id) {
  return m_viewports.erase(id) != 0;
}

const Viewport* SimulationState::getViewport(int id) const {
  auto it = m_viewports.find(id);
  return it != m_viewports.end() ? &it->second : nullptr;
}

AABB SimulationState::getWorldClip(const Viewport& viewport) const {
  if (!isShapeAlive(viewport.camera)) {
    return AABB(viewport.x1, viewport.y1, viewport.x2, viewport.y2);
  }
  const Vector2D center = m_shapes[viewport.camera.index].record.hitbox.bounds.center();
  const Vector2D halfSize(viewport.width() * 0.5f, viewport.height() * 0.5f);
  return AABB::fromCenter(center, halfSize);
}

void SimulationState::setRenderLayer(int id, RenderCallback layer) {
  if (id == 0) {
    SIMSTATE_ERROR("Attempted to set a render layer with an id of 0");
    throw std::invalid_argument(
        "Lattice Engine - Render layer id 0 is reserved for shapes");
  }
  if (!layer) {
    removeRenderLayer(id);
    return;
  }
  m_renderLayers[id] = std::move(layer);
}

bool SimulationState::removeRenderLayer(int id) {
  return m_renderLayers.erase(id) != 0;
}

bool SimulationState::renderViewport(int id, const AABB& worldClip, SDL_Renderer* renderer,
                                     float interpolationAlpha) {
  auto it = m_viewports.find(id);
  if (it == m_viewports.end()) {
    SIMSTATE_WARN(std::format("renderViewport: no viewport with id {}", id));
    return false;
  }

  const RenderView view(m_chunkIndex, id, it->second, worldClip, renderer,
                        interpolationAlpha);

  // Copy: a layer may install or remove layers
  const auto layers = m_renderLayers;
  for (auto layer = layers.begin(); layer != layers.lower_bound(0); ++layer) {
    layer->second(view);
  }
  if (m_renderCallback) {
    m_renderCallback(view);
  }
  for (auto layer = layers.upper_bound(0); layer != layers.end(); ++layer) {
    layer->second(view);
  }
  return true;
}

void SimulationState::render(SDL_Renderer* renderer, float interpolationAlpha) {
  if (!m_entered) {
    return;
  }
  // Copy: callbacks may edit the viewport list
  const auto viewports = m_viewports;
  for (const auto& [id, viewport] : viewports) {
    if (viewport.isEmpty()) {
      continue;
    }
    renderViewport(id, getWorldClip(viewport), renderer, interpolationAlpha);
  }
}
