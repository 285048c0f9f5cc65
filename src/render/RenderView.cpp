/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "render/RenderView.hpp"
#include <limits>

namespace LatticeEngine {

RenderView::RenderView(const ChunkIndex& index, int viewportId, const Viewport& viewport,
                       const AABB& worldClip, SDL_Renderer* renderer,
                       float interpolationAlpha)
    : m_index(index),
      m_viewportId(viewportId),
      m_viewport(viewport),
      m_worldClip(worldClip),
      mp_renderer(renderer),
      m_interpolationAlpha(interpolationAlpha) {}

void RenderView::forEachVisible(int minLayer, int maxLayer, const HitboxVisitor& fn) const {
    m_index.forEachVisible(minLayer, maxLayer, m_worldClip, fn);
}

void RenderView::forEachBackground(const HitboxVisitor& fn) const {
    m_index.forEachVisible(std::numeric_limits<int>::min(), -1, m_worldClip, fn);
}

void RenderView::forEachForeground(const HitboxVisitor& fn) const {
    m_index.forEachVisible(0, std::numeric_limits<int>::max(), m_worldClip, fn);
}

void RenderView::query(HitboxRole role, std::vector<const Hitbox*>& out) const {
    m_index.query(role, m_worldClip, out);
}

Vector2D RenderView::worldToScreen(const Vector2D& world) const {
    return world - m_worldClip.topLeft() + Vector2D(m_viewport.x1, m_viewport.y1);
}

} // namespace LatticeEngine
