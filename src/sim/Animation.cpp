/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "sim/Animation.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace LatticeEngine {

Animation::Animation(std::vector<AnimationFrame> frames) : m_frames(std::move(frames)) {
    if (m_frames.empty()) {
        ANIMATION_ERROR("Attempted to create an Animation with no frames");
        throw std::invalid_argument("Lattice Engine - An Animation needs at least one frame");
    }
    int deepest = 0;
    for (const AnimationFrame& frame : m_frames) {
        if (frame.child) {
            deepest = std::max(deepest, frame.child->getLevel());
        }
    }
    m_level = deepest + 1;
}

const AnimationFrame& Animation::getFrame(int index) const {
    if (index < 0 || index >= getFrameCount()) {
        throw std::out_of_range(std::format(
            "Lattice Engine - Animation frame {} out of range [0, {})", index,
            getFrameCount()));
    }
    return m_frames[static_cast<size_t>(index)];
}

Frac::Value Animation::getFrameDuration(int index) const {
    return getFrame(index).duration;
}

bool Animation::framesAreCompatible(int a, int b) const {
    return getFrame(a).child == getFrame(b).child;
}

AnimationInstance::AnimationInstance(std::shared_ptr<const Animation> animation)
    : m_animation(std::move(animation)) {
    if (!m_animation) {
        ANIMATION_ERROR("Attempted to create an AnimationInstance of a null Animation");
        throw std::invalid_argument("Lattice Engine - AnimationInstance needs an Animation");
    }
    const auto levels = static_cast<size_t>(m_animation->getLevel());
    m_indices.assign(levels, 0);
    m_indexChanges.assign(levels, 0);
    m_speedRemainders.assign(levels, 0);
    m_speeds.assign(levels, 0);
    updateCurrentSprite();
}

void AnimationInstance::checkLevel(int level, const char* operation) const {
    if (level < 0 || level >= getLevelCount()) {
        ANIMATION_ERROR(std::format("{}: invalid level {}", operation, level));
        throw std::out_of_range(std::format(
            "Lattice Engine - {}: invalid animation level {} (levels: {})",
            operation, level, getLevelCount()));
    }
}

int AnimationInstance::getIndex(int level) const {
    checkLevel(level, "getIndex");
    return m_indices[static_cast<size_t>(level)];
}

Frac::Value AnimationInstance::getSpeed(int level) const {
    checkLevel(level, "getSpeed");
    return m_speeds[static_cast<size_t>(level)];
}

void AnimationInstance::setSpeed(int level, Frac::Value speed) {
    checkLevel(level, "setSpeed");
    m_speeds[static_cast<size_t>(level)] = speed;
}

const Animation* AnimationInstance::animationAt(int level) const {
    const Animation* frames = m_animation.get();
    for (int i = getLevelCount() - 1; i > level && frames; --i) {
        frames = frames->getFrame(m_indices[static_cast<size_t>(i)]).child.get();
    }
    return frames;
}

Frac::Value AnimationInstance::moveIndex(int level, const Animation* frames, int index,
                                         bool resetLowerIndices) {
    const auto lvl = static_cast<size_t>(level);
    if (!frames) {
        // Below a sprite frame there is exactly one frame
        m_indices[lvl] = 0;
        return 0;
    }

    const int count = frames->getFrameCount();
    index %= count;
    if (index < 0) {
        index += count;
    }
    if (level > 0 &&
        (resetLowerIndices || !frames->framesAreCompatible(m_indices[lvl], index))) {
        for (size_t i = 0; i < lvl; ++i) {
            m_indices[i] = 0;
            m_indexChanges[i] = 0;
            m_speedRemainders[i] = 0;
        }
    }
    m_indices[lvl] = index;
    return frames->getFrameDuration(index);
}

void AnimationInstance::setIndex(int level, int index, bool resetLowerIndices) {
    checkLevel(level, "setIndex");
    moveIndex(level, animationAt(level), index, resetLowerIndices);
    m_indexChanges[static_cast<size_t>(level)] = 0;
    m_speedRemainders[static_cast<size_t>(level)] = 0;
    updateCurrentSprite();
}

void AnimationInstance::advance(Frac::Value timeFactor, Frac::Value frameScale) {
    update(Frac::mulCarry(timeFactor, frameScale, m_timeRemainder));
}

void AnimationInstance::update(Frac::Value timeToRun) {
    if (timeToRun == 0) {
        return;
    }

    bool spriteChanged = false;
    const Animation* frames = m_animation.get();
    for (int i = getLevelCount() - 1; i >= 0 && frames; --i) {
        const auto lvl = static_cast<size_t>(i);
        const Frac::Value speed = m_speeds[lvl];
        if (speed != 0) {
            Frac::Value duration = frames->getFrameDuration(m_indices[lvl]);
            if (duration > 0) {
                m_indexChanges[lvl] += Frac::mulCarry(timeToRun, speed, m_speedRemainders[lvl]);
                if (speed > 0) {
                    while (m_indexChanges[lvl] >= duration) {
                        spriteChanged = true;
                        m_indexChanges[lvl] -= duration;
                        duration = moveIndex(i, frames, m_indices[lvl] + 1, false);
                        if (duration <= 0) {
                            m_indexChanges[lvl] = 0;
                            m_speedRemainders[lvl] = 0;
                            break;
                        }
                    }
                } else {
                    while (m_indexChanges[lvl] < 0) {
                        spriteChanged = true;
                        duration = moveIndex(i, frames, m_indices[lvl] - 1, false);
                        if (duration <= 0) {
                            m_indexChanges[lvl] = 0;
                            m_speedRemainders[lvl] = 0;
                            break;
                        }
                        m_indexChanges[lvl] += duration;
                    }
                }
            }
        }
        frames = frames->getFrame(m_indices[lvl]).child.get();
    }

    if (spriteChanged) {
        updateCurrentSprite();
    }
}

void AnimationInstance::updateCurrentSprite() {
    const Animation* frames = m_animation.get();
    for (int i = getLevelCount() - 1; i >= 0 && frames; --i) {
        const AnimationFrame& frame = frames->getFrame(m_indices[static_cast<size_t>(i)]);
        if (!frame.child) {
            m_currentSprite = frame.spriteId;
            return;
        }
        frames = frame.child.get();
    }
    m_currentSprite = -1;
}

} // namespace LatticeEngine
