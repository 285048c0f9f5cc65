/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "render/ShapeRenderer.hpp"
#include "core/Logger.hpp"
#include <array>
#include <format>

namespace LatticeEngine {

namespace {
constexpr std::array<SDL_Color, 6> LAYER_PALETTE{{
    {90, 110, 140, 255},
    {200, 200, 210, 255},
    {220, 120, 60, 255},
    {90, 180, 100, 255},
    {180, 90, 180, 255},
    {230, 210, 80, 255},
}};
} // namespace

void ShapeRenderer::draw(const RenderView& view) {
    SDL_Renderer* renderer = view.getRenderer();
    if (!renderer) {
        return;
    }

    const Viewport& viewport = view.getViewport();
    const SDL_Rect clip{static_cast<int>(viewport.x1), static_cast<int>(viewport.y1),
                        static_cast<int>(viewport.width()),
                        static_cast<int>(viewport.height())};
    if (!SDL_SetRenderClipRect(renderer, &clip)) {
        RENDER_ERROR(std::format("Failed to set clip for viewport {}: {}",
                                 view.getViewportId(), SDL_GetError()));
        return;
    }

    auto visit = [&view](const Hitbox& hitbox) { drawHitbox(view, hitbox); };
    view.forEachBackground(visit);
    view.forEachForeground(visit);

    SDL_SetRenderClipRect(renderer, nullptr);
}

void ShapeRenderer::drawHitbox(const RenderView& view, const Hitbox& hitbox) {
    SDL_Renderer* renderer = view.getRenderer();
    const Vector2D topLeft = view.worldToScreen(Vector2D(hitbox.bounds.x1, hitbox.bounds.y1));
    const SDL_FRect rect{topLeft.getX(), topLeft.getY(), hitbox.bounds.width(),
                         hitbox.bounds.height()};

    const SDL_Color color = layerColor(hitbox.drawLayer);
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);

    if (hitbox.hasRole(HitboxRole::Solid) && !s_outlineOnly) {
        SDL_RenderFillRect(renderer, &rect);
    } else {
        SDL_RenderRect(renderer, &rect);
    }
}

SDL_Color ShapeRenderer::layerColor(int drawLayer) {
    const int size = static_cast<int>(LAYER_PALETTE.size());
    const int index = ((drawLayer % size) + size) % size;
    return LAYER_PALETTE[static_cast<size_t>(index)];
}

} // namespace LatticeEngine
