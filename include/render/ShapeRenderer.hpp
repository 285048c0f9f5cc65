/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SHAPE_RENDERER_HPP
#define SHAPE_RENDERER_HPP

#include "collisions/Hitbox.hpp"
#include "render/RenderView.hpp"
#include <SDL3/SDL.h>

namespace LatticeEngine {

/**
 * @brief Debug renderer that draws every visible locator as a rectangle
 *
 * Install draw() as a SimulationState render callback. Shapes are clipped to
 * the viewport and drawn background first, each layer in its own color.
 * Solid shapes are filled, the rest outlined.
 */
class ShapeRenderer {
public:
    static void draw(const RenderView& view);

    static void setOutlineOnly(bool outlineOnly) { s_outlineOnly = outlineOnly; }

private:
    static void drawHitbox(const RenderView& view, const Hitbox& hitbox);
    static SDL_Color layerColor(int drawLayer);

    static inline bool s_outlineOnly{false};
};

} // namespace LatticeEngine

#endif // SHAPE_RENDERER_HPP
