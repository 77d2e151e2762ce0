// ============================================================================
// geometry/geometry_kit.hpp - Joint angles and distances
// ============================================================================
#pragma once
#include <cmath>
#include <algorithm>
#include <eigen3/Eigen/Dense>
#include "../ortho_types.hpp"

namespace ortho {
namespace geometry {

const float RAD_TO_DEG = 180.0f / 3.14159265358979f;

inline Eigen::Vector3f point(const Joint& j) {
    return Eigen::Vector3f(j.x, j.y, j.z);
}

inline Eigen::Vector3f midpoint(const Eigen::Vector3f& a, const Eigen::Vector3f& b) {
    return (a + b) * 0.5f;
}

// Angle at vertex b between rays b->a and b->c, in degrees.
// Zero-length rays give 0.
inline float angle(const Eigen::Vector3f& a, const Eigen::Vector3f& b, const Eigen::Vector3f& c) {
    Eigen::Vector3f ba = a - b;
    Eigen::Vector3f bc = c - b;

    float norm_ba = ba.norm();
    float norm_bc = bc.norm();
    if (norm_ba == 0.0f || norm_bc == 0.0f) {
        return 0.0f;
    }

    float cosine = ba.dot(bc) / (norm_ba * norm_bc);
    cosine = std::max(-1.0f, std::min(1.0f, cosine));
    return std::acos(cosine) * RAD_TO_DEG;
}

inline float angle(const Joint& a, const Joint& b, const Joint& c) {
    return angle(point(a), point(b), point(c));
}

inline float distance(const Eigen::Vector3f& a, const Eigen::Vector3f& b) {
    return (a - b).norm();
}

inline float distance(const Joint& a, const Joint& b) {
    return distance(point(a), point(b));
}

// Image-plane angle between segment from->to and a reference direction
// (y grows downward, so up is (0,-1)). Zero-length segments give 0.
inline float projected_angle(const Eigen::Vector3f& from, const Eigen::Vector3f& to,
                             const Eigen::Vector2f& reference) {
    Eigen::Vector2f seg(to.x() - from.x(), to.y() - from.y());
    float norm = seg.norm();
    if (norm == 0.0f) {
        return 0.0f;
    }
    float cosine = seg.dot(reference) / (norm * reference.norm());
    cosine = std::max(-1.0f, std::min(1.0f, cosine));
    return std::acos(cosine) * RAD_TO_DEG;
}

inline float angle_from_vertical(const Eigen::Vector3f& from, const Eigen::Vector3f& to) {
    return projected_angle(from, to, Eigen::Vector2f(0.0f, -1.0f));
}

inline float angle_from_down(const Eigen::Vector3f& from, const Eigen::Vector3f& to) {
    return projected_angle(from, to, Eigen::Vector2f(0.0f, 1.0f));
}

// ============================================================================
// Body landmarks derived from a frame
// ============================================================================
inline Eigen::Vector3f shoulder_mid(const Frame& f) {
    return midpoint(point(f[joint::LEFT_SHOULDER]), point(f[joint::RIGHT_SHOULDER]));
}

inline Eigen::Vector3f hip_mid(const Frame& f) {
    return midpoint(point(f[joint::LEFT_HIP]), point(f[joint::RIGHT_HIP]));
}

inline Eigen::Vector3f ankle_mid(const Frame& f) {
    return midpoint(point(f[joint::LEFT_ANKLE]), point(f[joint::RIGHT_ANKLE]));
}

inline float left_knee_angle(const Frame& f) {
    return angle(f[joint::LEFT_HIP], f[joint::LEFT_KNEE], f[joint::LEFT_ANKLE]);
}

inline float right_knee_angle(const Frame& f) {
    return angle(f[joint::RIGHT_HIP], f[joint::RIGHT_KNEE], f[joint::RIGHT_ANKLE]);
}

// The more flexed of the two knees
inline float min_knee_angle(const Frame& f) {
    return std::min(left_knee_angle(f), right_knee_angle(f));
}

inline float knee_distance(const Frame& f) {
    return distance(f[joint::LEFT_KNEE], f[joint::RIGHT_KNEE]);
}

inline float ankle_distance(const Frame& f) {
    return distance(f[joint::LEFT_ANKLE], f[joint::RIGHT_ANKLE]);
}

// |shoulder_mid.x - hip_mid.x| normalized by spine length, 0 for a collapsed spine
inline float torso_lean_ratio(const Frame& f) {
    Eigen::Vector3f sh = shoulder_mid(f);
    Eigen::Vector3f hip = hip_mid(f);
    float spine = distance(sh, hip);
    if (spine == 0.0f) {
        return 0.0f;
    }
    return std::abs(sh.x() - hip.x()) / spine;
}

} // namespace geometry
} // namespace ortho
