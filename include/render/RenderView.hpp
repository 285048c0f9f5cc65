/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RENDER_VIEW_HPP
#define RENDER_VIEW_HPP

#include "collisions/AABB.hpp"
#include "collisions/ChunkIndex.hpp"
#include "collisions/Hitbox.hpp"
#include "utils/Vector2D.hpp"
#include <functional>
#include <vector>

struct SDL_Renderer;

namespace LatticeEngine {

/**
 * @brief Screen rectangle showing the world around a camera shape
 *
 * Screen coordinates are in render target pixels. Without a live camera the
 * viewport shows the world region equal to its own screen rectangle.
 */
struct Viewport {
    float x1{0.0f};
    float y1{0.0f};
    float x2{0.0f};
    float y2{0.0f};
    ShapeHandle camera{};

    bool isEmpty() const { return x1 == x2 || y1 == y2; }
    float width() const { return x2 - x1; }
    float height() const { return y2 - y1; }
};

/**
 * @brief What a renderer sees of a SimulationState for one viewport
 *
 * Only valid for the duration of the render call it was passed to.
 */
class RenderView {
public:
    using HitboxVisitor = std::function<void(const Hitbox&)>;

    RenderView(const ChunkIndex& index, int viewportId, const Viewport& viewport,
               const AABB& worldClip, SDL_Renderer* renderer, float interpolationAlpha);

    // Locators overlapping the world clip, ascending by layer
    void forEachVisible(int minLayer, int maxLayer, const HitboxVisitor& fn) const;

    // Layers below 0
    void forEachBackground(const HitboxVisitor& fn) const;

    // Layers 0 and above
    void forEachForeground(const HitboxVisitor& fn) const;

    void query(HitboxRole role, std::vector<const Hitbox*>& out) const;

    // Maps a world position to render target pixels
    Vector2D worldToScreen(const Vector2D& world) const;

    int getViewportId() const { return m_viewportId; }
    const Viewport& getViewport() const { return m_viewport; }
    const AABB& getWorldClip() const { return m_worldClip; }
    SDL_Renderer* getRenderer() const { return mp_renderer; }
    float getInterpolationAlpha() const { return m_interpolationAlpha; }

private:
    const ChunkIndex& m_index;
    int m_viewportId;
    Viewport m_viewport;
    AABB m_worldClip;
    SDL_Renderer* mp_renderer;
    float m_interpolationAlpha;
};

// Invoked once per viewport and render layer
using RenderCallback = std::function<void(const RenderView&)>;

} // namespace LatticeEngine

#endif // RENDER_VIEW_HPP
