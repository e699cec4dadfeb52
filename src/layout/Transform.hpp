#pragma once

#include <vector>

#include <glm/mat3x3.hpp>

#include "layout/Element.hpp"
#include "utils/Vec2.hpp"

// 2D affine transform held as a homogeneous 3x3 matrix (column-major, glm convention).
// Composition is matrix multiplication: (parent * instance).Apply(p) == parent.Apply(instance.Apply(p)).
class Transform
{
public:
    Transform();
    explicit Transform(const glm::dmat3& matrix);

    static Transform Translation(const Vec2& offset);
    static Transform Rotation(double angle_degrees);
    static Transform Scale(double scale_x, double scale_y);
    static Transform ReflectionX();  // y -> -y

    // Instance transform of a reference placed at origin: reflect, rotate, magnify, translate.
    static Transform FromStrans(const Strans& strans, const Vec2& origin);

    Transform operator*(const Transform& rhs) const;

    [[nodiscard]] Vec2 Apply(const Vec2& point) const;
    [[nodiscard]] std::vector<Vec2> Apply(const std::vector<Vec2>& points) const;

    // Uniform scale factor, sqrt(|det|) of the linear part.
    [[nodiscard]] double Magnification() const;
    [[nodiscard]] bool IsIdentity() const;
    [[nodiscard]] Transform Inverse() const;

    [[nodiscard]] const glm::dmat3& Matrix() const { return m_matrix_; }

private:
    glm::dmat3 m_matrix_;
};
