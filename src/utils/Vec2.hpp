#pragma once

#include <cmath>  // For std::sqrt

// 2D point / vector in world or screen space.
struct Vec2 {
    double x_ax, y_ax;

    Vec2(double x = 0.0, double y = 0.0) : x_ax(x), y_ax(y) {}

    Vec2 operator-(const Vec2& other) const { return {x_ax - other.x_ax, y_ax - other.y_ax}; }
    Vec2 operator+(const Vec2& other) const { return {x_ax + other.x_ax, y_ax + other.y_ax}; }
    Vec2 operator*(double scalar) const { return {x_ax * scalar, y_ax * scalar}; }
    Vec2 operator/(double scalar) const { return {x_ax / scalar, y_ax / scalar}; }
    Vec2& operator+=(const Vec2& other)
    {
        x_ax += other.x_ax;
        y_ax += other.y_ax;
        return *this;
    }
    Vec2& operator-=(const Vec2& other)
    {
        x_ax -= other.x_ax;
        y_ax -= other.y_ax;
        return *this;
    }
    Vec2 operator-() const { return {-x_ax, -y_ax}; }
    bool operator==(const Vec2& other) const { return x_ax == other.x_ax && y_ax == other.y_ax; }
    bool operator!=(const Vec2& other) const { return !(*this == other); }

    // z component of the 3D cross product
    [[nodiscard]] double Cross(const Vec2& other) const { return (x_ax * other.y_ax) - (y_ax * other.x_ax); }
    [[nodiscard]] double LengthSquared() const { return (x_ax * x_ax) + (y_ax * y_ax); }
    [[nodiscard]] double Length() const
    {
        if (LengthSquared() == 0.0) {
            return 0.0;
        }
        return std::sqrt(LengthSquared());
    }
    // Counter-clockwise perpendicular
    [[nodiscard]] Vec2 Perpendicular() const { return {-y_ax, x_ax}; }
    [[nodiscard]] bool IsFinite() const { return std::isfinite(x_ax) && std::isfinite(y_ax); }
};
