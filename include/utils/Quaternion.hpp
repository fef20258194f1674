/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef QUATERNION_HPP
#define QUATERNION_HPP

#include "utils/Vector3D.hpp"
#include <cmath>

namespace GlyphFlow {

// Unit quaternion for the world rotation used by anamorphic text
class Quaternion {
public:
    Quaternion() = default;
    Quaternion(float x, float y, float z, float w) : m_x(x), m_y(y), m_z(z), m_w(w) {}

    static Quaternion identity() { return Quaternion(); }

    /**
     * @brief Shortest-arc rotation taking unit vector `from` onto unit vector `to`
     *
     * Antiparallel inputs pick an arbitrary perpendicular axis.
     */
    static Quaternion fromUnitVectors(const Vector3D& from, const Vector3D& to) {
        float r = from.dot(to) + 1.0f;
        Quaternion q;
        if (r < 1e-6f) {
            r = 0.0f;
            if (std::fabs(from.getX()) > std::fabs(from.getZ())) {
                q = Quaternion(-from.getY(), from.getX(), 0.0f, r);
            } else {
                q = Quaternion(0.0f, -from.getZ(), from.getY(), r);
            }
        } else {
            Vector3D c = from.cross(to);
            q = Quaternion(c.getX(), c.getY(), c.getZ(), r);
        }
        return q.normalized();
    }

    float getX() const { return m_x; }
    float getY() const { return m_y; }
    float getZ() const { return m_z; }
    float getW() const { return m_w; }

    float length() const {
        return std::sqrt(m_x * m_x + m_y * m_y + m_z * m_z + m_w * m_w);
    }

    Quaternion normalized() const {
        float l = length();
        if (l <= 0.0f) return Quaternion();
        float inv = 1.0f / l;
        return Quaternion(m_x * inv, m_y * inv, m_z * inv, m_w * inv);
    }

    // Conjugate; equal to the inverse for unit quaternions
    Quaternion inverse() const { return Quaternion(-m_x, -m_y, -m_z, m_w); }

    static constexpr float IDENTITY_EPSILON = 1e-6f;

    // Within IDENTITY_EPSILON of identity (q and -q are the same rotation)
    bool isIdentity() const {
        return std::fabs(m_x) <= IDENTITY_EPSILON && std::fabs(m_y) <= IDENTITY_EPSILON &&
               std::fabs(m_z) <= IDENTITY_EPSILON &&
               std::fabs(std::fabs(m_w) - 1.0f) <= IDENTITY_EPSILON;
    }

    float dot(const Quaternion& q) const {
        return m_x * q.m_x + m_y * q.m_y + m_z * q.m_z + m_w * q.m_w;
    }

    Quaternion operator*(const Quaternion& q) const {
        return Quaternion(m_w * q.m_x + m_x * q.m_w + m_y * q.m_z - m_z * q.m_y,
                          m_w * q.m_y - m_x * q.m_z + m_y * q.m_w + m_z * q.m_x,
                          m_w * q.m_z + m_x * q.m_y - m_y * q.m_x + m_z * q.m_w,
                          m_w * q.m_w - m_x * q.m_x - m_y * q.m_y - m_z * q.m_z);
    }

    Vector3D rotate(const Vector3D& v) const {
        // t = 2 * cross(q.xyz, v); v' = v + w * t + cross(q.xyz, t)
        Vector3D u(m_x, m_y, m_z);
        Vector3D t = u.cross(v) * 2.0f;
        return v + t * m_w + u.cross(t);
    }

    /**
     * @brief Spherical interpolation toward `target` by fraction t in [0,1]
     */
    Quaternion slerp(const Quaternion& target, float t) const {
        if (t <= 0.0f) return *this;
        if (t >= 1.0f) return target;

        Quaternion to = target;
        float cosHalf = dot(target);
        if (cosHalf < 0.0f) {
            to = Quaternion(-target.m_x, -target.m_y, -target.m_z, -target.m_w);
            cosHalf = -cosHalf;
        }
        // Indistinguishable in float precision; land exactly on the target
        if (cosHalf >= 1.0f) return to;

        const float sqrSin = 1.0f - cosHalf * cosHalf;
        if (sqrSin <= 1e-6f) {
            float s = 1.0f - t;
            return Quaternion(s * m_x + t * to.m_x, s * m_y + t * to.m_y,
                              s * m_z + t * to.m_z, s * m_w + t * to.m_w)
                .normalized();
        }

        const float sinHalf = std::sqrt(sqrSin);
        const float halfTheta = std::atan2(sinHalf, cosHalf);
        const float ratioA = std::sin((1.0f - t) * halfTheta) / sinHalf;
        const float ratioB = std::sin(t * halfTheta) / sinHalf;
        return Quaternion(m_x * ratioA + to.m_x * ratioB, m_y * ratioA + to.m_y * ratioB,
                          m_z * ratioA + to.m_z * ratioB, m_w * ratioA + to.m_w * ratioB);
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
    float m_z{0.0f};
    float m_w{1.0f};
};

} // namespace GlyphFlow

#endif  // QUATERNION_HPP
