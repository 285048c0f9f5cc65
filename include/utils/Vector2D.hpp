/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <cmath>
#include <ostream>

// World or screen position/extent in pixels, y grows downwards
class Vector2D {
public:
    Vector2D() = default;
    Vector2D(float x, float y) : m_x(x), m_y(y) {}

    float getX() const { return m_x; }
    float getY() const { return m_y; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }

    float lengthSquared() const { return m_x * m_x + m_y * m_y; }
    float length() const { return std::sqrt(lengthSquared()); }

    Vector2D operator+(const Vector2D& other) const { return Vector2D(m_x + other.m_x, m_y + other.m_y); }
    Vector2D operator-(const Vector2D& other) const { return Vector2D(m_x - other.m_x, m_y - other.m_y); }
    Vector2D operator-() const { return Vector2D(-m_x, -m_y); }
    Vector2D operator*(float scalar) const { return Vector2D(m_x * scalar, m_y * scalar); }
    Vector2D operator/(float scalar) const { return Vector2D(m_x / scalar, m_y / scalar); }

    Vector2D& operator+=(const Vector2D& other) {
        m_x += other.m_x;
        m_y += other.m_y;
        return *this;
    }

    Vector2D& operator-=(const Vector2D& other) {
        m_x -= other.m_x;
        m_y -= other.m_y;
        return *this;
    }

    bool operator==(const Vector2D& other) const = default;

private:
    float m_x{0.0f};
    float m_y{0.0f};
};

inline std::ostream& operator<<(std::ostream& os, const Vector2D& v) {
    return os << '(' << v.getX() << ", " << v.getY() << ')';
}

#endif  // VECTOR_2D_HPP
