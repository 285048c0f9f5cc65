/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIMULATION_STATE_HPP
#define SIMULATION_STATE_HPP

#include "collisions/AABB.hpp"
#include "collisions/ChunkIndex.hpp"
#include "collisions/Hitbox.hpp"
#include "core/FixedPoint.hpp"
#include "core/SimulationConfig.hpp"
#include "gameStates/GameState.hpp"
#include "render/RenderView.hpp"
#include "sim/Animation.hpp"
#include "sim/NodeScheduler.hpp"
#include "sim/PendingChanges.hpp"
#include "sim/SimHandles.hpp"
#include <array>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Game state that owns and drives one simulation
 *
 * Owns the node tree, the shape arena, the chunk index, animations and
 * viewports. update() is the frame driver: animations, clocks, tick passes,
 * the frame pass, and flushes of deferred changes between them. Time only
 * passes while the state is active (entered and not paused).
 *
 * Structural requests made while a pass runs are buffered and applied at the
 * next flush; requests from outside a pass apply at once.
 */
class SimulationState : public GameState {
 public:
  explicit SimulationState(std::string name = "SimulationState",
                           const LatticeEngine::SimulationConfig& config = {});
  ~SimulationState() override;

  SimulationState(const SimulationState&) = delete;
  SimulationState& operator=(const SimulationState&) = delete;

  bool enter() override;
  void update(float deltaTime) override;
  void render(SDL_Renderer* renderer, float interpolationAlpha = 1.0f) override;
  bool exit() override;
  void pause() override;
  void resume() override;
  std::string getName() const override { return m_name; }

  bool isActive() const { return m_entered && !m_paused; }
  bool isEntered() const { return m_entered; }
  bool isInPass() const { return m_changes.isDeferring(); }

  // Frame driver

  /**
   * @brief Runs one frame of simulation
   * @param deltaSeconds Wall-clock time since the previous frame
   *
   * If a hook pauses or exits the state, the remaining tick passes are
   * skipped and their ticks stay in the nodes' leftover time.
   */
  void advanceFrame(double deltaSeconds);
  uint64_t getFrameCount() const { return m_frameCount; }

  LatticeEngine::Frac::Value getTimeFactor() const { return m_timeFactor; }

  /**
   * @throws std::invalid_argument if timeFactor is negative
   */
  void setTimeFactor(LatticeEngine::Frac::Value timeFactor);

  LatticeEngine::FrameScaler& getFrameScaler() { return m_frameScaler; }

  // Nodes
  LatticeEngine::NodeScheduler& getScheduler() { return m_scheduler; }
  const LatticeEngine::NodeScheduler& getScheduler() const { return m_scheduler; }

  // Shapes

  /**
   * @brief Creates a shape outside the state; roles take effect once added
   * @throws std::invalid_argument if bounds are inverted
   */
  LatticeEngine::ShapeHandle createShape(const LatticeEngine::AABB& bounds, int drawLayer = 0);

  /**
   * @return false if the handle is stale or destruction is already pending
   */
  bool destroyShape(LatticeEngine::ShapeHandle shape);

  // Deferred during passes; false if already added / already removed
  bool addShape(LatticeEngine::ShapeHandle shape);
  bool removeShape(LatticeEngine::ShapeHandle shape);

  bool isShapeAlive(LatticeEngine::ShapeHandle shape) const;
  bool isShapeInState(LatticeEngine::ShapeHandle shape) const;
  size_t getShapeCount() const { return m_liveShapes; }

  void setShapeBounds(LatticeEngine::ShapeHandle shape, const LatticeEngine::AABB& bounds);

  /**
   * @brief Turns a role on or off
   * @return false if the role already had that state
   */
  bool setShapeRole(LatticeEngine::ShapeHandle shape, LatticeEngine::HitboxRole role, bool active);
  bool getShapeRole(LatticeEngine::ShapeHandle shape, LatticeEngine::HitboxRole role) const;

  void setShapeDrawLayer(LatticeEngine::ShapeHandle shape, int drawLayer);

  /**
   * @throws std::out_of_range on a stale handle
   */
  const LatticeEngine::Hitbox& getShape(LatticeEngine::ShapeHandle shape) const;

  // Shapes in the state with role overlapping region, sorted by handle
  void queryShapes(LatticeEngine::HitboxRole role, const LatticeEngine::AABB& region,
                   std::vector<LatticeEngine::ShapeHandle>& out) const;

  const LatticeEngine::ChunkIndex& getChunkIndex() const { return m_chunkIndex; }

  /**
   * @brief Re-indexes all shapes with new chunk dimensions
   * @throws std::invalid_argument if either dimension is not positive
   */
  void setChunkDimensions(float chunkWidth, float chunkHeight);

  // Animations

  /**
   * @return false if animation is null or already registered
   */
  bool addAnimation(std::shared_ptr<LatticeEngine::AnimationInstance> animation);
  bool removeAnimation(const std::shared_ptr<LatticeEngine::AnimationInstance>& animation);
  size_t getAnimationCount() const { return m_animations.size(); }

  // Rendering

  void setViewport(int id, const LatticeEngine::Viewport& viewport);
  bool removeViewport(int id);
  void clearViewports() { m_viewports.clear(); }
  const LatticeEngine::Viewport* getViewport(int id) const;

  // World region a viewport shows, centered on its camera
  LatticeEngine::AABB getWorldClip(const LatticeEngine::Viewport& viewport) const;

  // Called for every viewport between background and foreground layers
  void setRenderCallback(LatticeEngine::RenderCallback callback) {
    m_renderCallback = std::move(callback);
  }

  /**
   * @brief Installs a render layer drawn under (id < 0) or over (id > 0) shapes
   * @throws std::invalid_argument for id 0, which marks the shapes themselves
   */
  void setRenderLayer(int id, LatticeEngine::RenderCallback layer);
  bool removeRenderLayer(int id);
  void clearRenderLayers() { m_renderLayers.clear(); }

  /**
   * @brief Renders one viewport with an explicit world clip region
   * @return false if no viewport has that id
   */
  bool renderViewport(int id, const LatticeEngine::AABB& worldClip,
                      SDL_Renderer* renderer = nullptr, float interpolationAlpha = 1.0f);

 private:
  struct ShapeRecord {
    LatticeEngine::Hitbox hitbox{};
    std::array<bool, LatticeEngine::HITBOX_ROLE_COUNT> requestedRoles{};
    bool inState{false};        // roles registered with the chunk index
    bool pendingInState{false}; // where add/removeShape requests lead
    bool destroyPending{false};
  };

  struct ShapeSlot {
    ShapeRecord record{};
    uint32_t generation{1};
    bool alive{false};
  };

  ShapeRecord& shapeRecord(LatticeEngine::ShapeHandle shape, const char* operation);
  const ShapeRecord& shapeRecord(LatticeEngine::ShapeHandle shape, const char* operation) const;

  void flushChanges();
  void applyChange(const LatticeEngine::StructuralChange& change);
  void applyAddShape(LatticeEngine::ShapeHandle shape);
  void applyRemoveShape(LatticeEngine::ShapeHandle shape);
  void freeShape(LatticeEngine::ShapeHandle shape);

  void updateAnimations(LatticeEngine::Frac::Value frameScale);

  std::string m_name;

  LatticeEngine::PendingChanges m_changes{};
  LatticeEngine::NodeScheduler m_scheduler;
  LatticeEngine::ChunkIndex m_chunkIndex;
  LatticeEngine::FrameScaler m_frameScaler;
  LatticeEngine::Frac::Value m_timeFactor;

  // deque keeps hitboxes at the stable addresses the chunk index refers to
  std::deque<ShapeSlot> m_shapes{};
  std::vector<uint32_t> m_freeShapeSlots{};
  size_t m_liveShapes{0};

  std::vector<std::shared_ptr<LatticeEngine::AnimationInstance>> m_animations{};

  std::map<int, LatticeEngine::Viewport> m_viewports{};
  std::map<int, LatticeEngine::RenderCallback> m_renderLayers{};
  LatticeEngine::RenderCallback m_renderCallback{};

  uint64_t m_frameCount{0};
  bool m_entered{false};
  bool m_paused{false};
};

#endif  // SIMULATION_STATE_HPP
