/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ANIMATION_HPP
#define ANIMATION_HPP

#include "core/FixedPoint.hpp"
#include <memory>
#include <vector>

namespace LatticeEngine {

class Animation;

/**
 * @brief One frame of an Animation: a sprite or a nested animation
 *
 * A duration of 0 or less holds the frame until the index is set explicitly.
 */
struct AnimationFrame {
    int spriteId{-1};                        // leaf frame, -1 draws nothing
    std::shared_ptr<const Animation> child{}; // nested frame
    Frac::Value duration{0};

    static AnimationFrame sprite(int id, Frac::Value frameDuration) {
        return AnimationFrame{id, nullptr, frameDuration};
    }
    static AnimationFrame nested(std::shared_ptr<const Animation> animation,
                                 Frac::Value frameDuration) {
        return AnimationFrame{-1, std::move(animation), frameDuration};
    }
};

/**
 * @brief Immutable sequence of frames, possibly nested
 *
 * The level of an animation is 1 plus the deepest level among its nested
 * frames. Level 0 of an instance indexes the innermost frames.
 */
class Animation {
public:
    /**
     * @throws std::invalid_argument if frames is empty
     */
    explicit Animation(std::vector<AnimationFrame> frames);

    int getLevel() const { return m_level; }
    int getFrameCount() const { return static_cast<int>(m_frames.size()); }
    const AnimationFrame& getFrame(int index) const;
    Frac::Value getFrameDuration(int index) const;

    // Switching between compatible frames keeps lower-level indices
    bool framesAreCompatible(int a, int b) const;

private:
    std::vector<AnimationFrame> m_frames;
    int m_level{1};
};

/**
 * @brief Playback state of an Animation
 *
 * Keeps one frame index and one speed per level. Speeds are fixed-point
 * multipliers (Frac::UNIT plays at normal speed, negative plays backwards,
 * 0 stops that level). Instances are advanced by SimulationState once per
 * frame while registered with it.
 */
class AnimationInstance {
public:
    /**
     * @throws std::invalid_argument if animation is null
     */
    explicit AnimationInstance(std::shared_ptr<const Animation> animation);

    const Animation& getAnimation() const { return *m_animation; }
    int getLevelCount() const { return static_cast<int>(m_indices.size()); }

    /**
     * @throws std::out_of_range if level is not in [0, getLevelCount())
     */
    int getIndex(int level) const;
    int getIndex() const { return m_indices.back(); }

    /**
     * @brief Jumps to a frame; the index wraps around the frame count
     * @throws std::out_of_range if level is not in [0, getLevelCount())
     */
    void setIndex(int level, int index, bool resetLowerIndices = true);
    void setIndex(int index) { setIndex(getLevelCount() - 1, index, true); }

    Frac::Value getSpeed(int level) const;
    Frac::Value getSpeed() const { return m_speeds.back(); }
    void setSpeed(int level, Frac::Value speed);
    void setSpeed(Frac::Value speed) { m_speeds.back() = speed; }

    // Negative inherits the owning state's factor
    Frac::Value getTimeFactor() const { return m_timeFactor; }
    void setTimeFactor(Frac::Value timeFactor) { m_timeFactor = timeFactor; }

    /**
     * @brief Advances every level with a non-zero speed
     * @param timeToRun Fixed-point time elapsed for this instance
     */
    void update(Frac::Value timeToRun);

    /**
     * @brief Advances by timeFactor scaled by frameScale
     *
     * Sub-unit bits of the product carry over to the next call, so the
     * total played time does not depend on how it was split into frames.
     */
    void advance(Frac::Value timeFactor, Frac::Value frameScale);

    // Sprite id of the current leaf frame, -1 if none
    int getCurrentSprite() const { return m_currentSprite; }

private:
    void checkLevel(int level, const char* operation) const;

    // Animation whose frames the given level indexes, null below a sprite
    const Animation* animationAt(int level) const;

    Frac::Value moveIndex(int level, const Animation* frames, int index,
                          bool resetLowerIndices);
    void updateCurrentSprite();

    std::shared_ptr<const Animation> m_animation;
    std::vector<int> m_indices;
    std::vector<Frac::Value> m_indexChanges;
    std::vector<Frac::Value> m_speeds;
    std::vector<Frac::Value> m_speedRemainders; // sub-unit bits per level
    Frac::Value m_timeRemainder{0};
    Frac::Value m_timeFactor{-1};
    int m_currentSprite{-1};
};

} // namespace LatticeEngine

#endif // ANIMATION_HPP
