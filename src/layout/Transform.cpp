#include "layout/Transform.hpp"

#include <cmath>

#include <glm/mat3x3.hpp>
#include <glm/matrix.hpp>
#include <glm/vec3.hpp>

#include "utils/GeometryUtils.hpp"

Transform::Transform() : m_matrix_(1.0) {}

Transform::Transform(const glm::dmat3& matrix) : m_matrix_(matrix) {}

Transform Transform::Translation(const Vec2& offset)
{
    glm::dmat3 matrix(1.0);
    matrix[2][0] = offset.x_ax;
    matrix[2][1] = offset.y_ax;
    return Transform(matrix);
}

Transform Transform::Rotation(double angle_degrees)
{
    double const kRad = geometry_utils::DegToRad(angle_degrees);
    double cos_a = std::cos(kRad);
    double sin_a = std::sin(kRad);
    // Snap quarter turns so right-angle placements stay exact
    if (std::fabs(cos_a) < 1e-15) {
        cos_a = 0.0;
    }
    if (std::fabs(sin_a) < 1e-15) {
        sin_a = 0.0;
    }
    glm::dmat3 matrix(1.0);
    matrix[0][0] = cos_a;
    matrix[0][1] = sin_a;
    matrix[1][0] = -sin_a;
    matrix[1][1] = cos_a;
    return Transform(matrix);
}

Transform Transform::Scale(double scale_x, double scale_y)
{
    glm::dmat3 matrix(1.0);
    matrix[0][0] = scale_x;
    matrix[1][1] = scale_y;
    return Transform(matrix);
}

Transform Transform::ReflectionX()
{
    return Scale(1.0, -1.0);
}

Transform Transform::FromStrans(const Strans& strans, const Vec2& origin)
{
    Transform result = Translation(origin);
    if (strans.angle != 0.0) {
        result = result * Rotation(strans.angle);
    }
    if (strans.magnification != 1.0) {
        result = result * Scale(strans.magnification, strans.magnification);
    }
    if (strans.reflection) {
        result = result * ReflectionX();
    }
    return result;
}

Transform Transform::operator*(const Transform& rhs) const
{
    return Transform(m_matrix_ * rhs.m_matrix_);
}

Vec2 Transform::Apply(const Vec2& point) const
{
    glm::dvec3 const kResult = m_matrix_ * glm::dvec3(point.x_ax, point.y_ax, 1.0);
    return {kResult.x, kResult.y};
}

std::vector<Vec2> Transform::Apply(const std::vector<Vec2>& points) const
{
    std::vector<Vec2> result;
    result.reserve(points.size());
    for (const Vec2& point : points) {
        result.push_back(Apply(point));
    }
    return result;
}

double Transform::Magnification() const
{
    double const kDet = (m_matrix_[0][0] * m_matrix_[1][1]) - (m_matrix_[1][0] * m_matrix_[0][1]);
    return std::sqrt(std::fabs(kDet));
}

bool Transform::IsIdentity() const
{
    return m_matrix_ == glm::dmat3(1.0);
}

Transform Transform::Inverse() const
{
    return Transform(glm::inverse(m_matrix_));
}
