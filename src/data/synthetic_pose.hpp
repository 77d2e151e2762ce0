// ============================================================================
// data/synthetic_pose.hpp - Parametric 33-joint skeletons for demos and tests
// ============================================================================
#pragma once
#include <vector>
#include <string>
#include <random>
#include <cmath>
#include <algorithm>
#include <eigen3/Eigen/Dense>
#include "../ortho_types.hpp"

namespace ortho {

// Normalized image coordinates: x to the subject's left is smaller, y grows
// downward, z grows away from the camera.
struct PoseParams {
    float left_knee_angle = 178.0f;     // degrees, hip-knee-ankle
    float right_knee_angle = 178.0f;
    float knee_half_width = 0.10f;      // knee x offset from the body midline
    float ankle_half_width = 0.10f;
    float left_ankle_lift = 0.0f;       // raises the left foot
    float left_ankle_depth = 0.0f;      // z offset of the left foot
    float lean = 0.0f;                  // shoulder shift / spine length
    float shoulder_half_width = 0.12f;
    float ear_height = 0.15f;           // ears above shoulders
    float arm_elevation = 0.0f;         // upper arm from hanging, degrees, sideways
    float elbow_angle = 178.0f;         // degrees, shoulder-elbow-wrist
    float left_wrist_drop = 0.0f;       // extra y on the left wrist
    float visibility = 1.0f;
};

namespace synthetic {

const float SHIN = 0.2f;
const float THIGH = 0.2f;
const float SPINE = 0.3f;
const float UPPER_ARM = 0.15f;
const float FOREARM = 0.15f;
const float FLOOR_Y = 0.9f;
const float MIDLINE_X = 0.5f;

inline Joint make_joint(const Eigen::Vector3f& p, float vis) {
    Joint j;
    j.x = p.x();
    j.y = p.y();
    j.z = p.z();
    j.visibility = vis;
    return j;
}

// Hip placed so the knee angle is exactly knee_deg; the bend goes toward +z
inline Eigen::Vector3f place_hip(const Eigen::Vector3f& knee, const Eigen::Vector3f& ankle, float knee_deg) {
    Eigen::Vector3f u = (ankle - knee).normalized();
    float rad = knee_deg * 3.14159265358979f / 180.0f;
    return knee + THIGH * (std::cos(rad) * u + std::sin(rad) * Eigen::Vector3f::UnitZ());
}

} // namespace synthetic

inline Frame build_pose(const PoseParams& p) {
    using namespace synthetic;
    Frame f;
    f.joints.resize(NUM_JOINTS);

    // Legs: side = -1 for left, +1 for right
    Eigen::Vector3f hips[2];
    Eigen::Vector3f knees[2];
    Eigen::Vector3f ankles[2];
    for (int s = 0; s < 2; ++s) {
        float side = s == 0 ? -1.0f : 1.0f;
        float lift = s == 0 ? p.left_ankle_lift : 0.0f;
        float depth = s == 0 ? p.left_ankle_depth : 0.0f;
        float knee_deg = s == 0 ? p.left_knee_angle : p.right_knee_angle;

        ankles[s] = Eigen::Vector3f(MIDLINE_X + side * p.ankle_half_width, FLOOR_Y - lift, depth);
        knees[s] = Eigen::Vector3f(MIDLINE_X + side * p.knee_half_width, ankles[s].y() - SHIN, depth);
        hips[s] = place_hip(knees[s], ankles[s], knee_deg);
    }

    // Torso
    Eigen::Vector3f hip_center = (hips[0] + hips[1]) * 0.5f;
    float dx = p.lean * SPINE;
    float dy = std::sqrt(std::max(0.0f, SPINE * SPINE - dx * dx));
    Eigen::Vector3f shoulder_center = hip_center + Eigen::Vector3f(dx, -dy, 0.0f);

    // Arms
    float elev = p.arm_elevation * 3.14159265358979f / 180.0f;
    float bend = (180.0f - p.elbow_angle) * 3.14159265358979f / 180.0f;
    Eigen::Vector3f shoulders[2];
    Eigen::Vector3f elbows[2];
    Eigen::Vector3f wrists[2];
    for (int s = 0; s < 2; ++s) {
        float side = s == 0 ? -1.0f : 1.0f;
        shoulders[s] = shoulder_center + Eigen::Vector3f(side * p.shoulder_half_width, 0.0f, 0.0f);
        Eigen::Vector3f dir(side * std::sin(elev), std::cos(elev), 0.0f);
        elbows[s] = shoulders[s] + UPPER_ARM * dir;
        Eigen::Vector3f forearm = std::cos(bend) * dir - std::sin(bend) * Eigen::Vector3f::UnitZ();
        wrists[s] = elbows[s] + FOREARM * forearm;
    }
    wrists[0].y() += p.left_wrist_drop;

    float v = p.visibility;
    Eigen::Vector3f nose = shoulder_center + Eigen::Vector3f(0.0f, -p.ear_height - 0.03f, -0.05f);

    f.joints[joint::NOSE] = make_joint(nose, v);
    for (size_t i = 1; i <= 3; ++i) {
        f.joints[i] = make_joint(nose + Eigen::Vector3f(-0.01f * i, -0.02f, 0.0f), v);       // left eye
        f.joints[i + 3] = make_joint(nose + Eigen::Vector3f(0.01f * i, -0.02f, 0.0f), v);    // right eye
    }
    f.joints[joint::LEFT_EAR] = make_joint(shoulders[0] + Eigen::Vector3f(0.06f, -p.ear_height, 0.0f), v);
    f.joints[joint::RIGHT_EAR] = make_joint(shoulders[1] + Eigen::Vector3f(-0.06f, -p.ear_height, 0.0f), v);
    f.joints[9] = make_joint(nose + Eigen::Vector3f(-0.015f, 0.03f, 0.0f), v);
    f.joints[10] = make_joint(nose + Eigen::Vector3f(0.015f, 0.03f, 0.0f), v);

    for (int s = 0; s < 2; ++s) {
        f.joints[joint::LEFT_SHOULDER + s] = make_joint(shoulders[s], v);
        f.joints[joint::LEFT_ELBOW + s] = make_joint(elbows[s], v);
        f.joints[joint::LEFT_WRIST + s] = make_joint(wrists[s], v);
        // pinky, index, thumb
        for (size_t h = 0; h < 3; ++h) {
            f.joints[17 + 2 * h + s] = make_joint(wrists[s] + Eigen::Vector3f(0.0f, 0.03f, 0.0f), v);
        }
        f.joints[joint::LEFT_HIP + s] = make_joint(hips[s], v);
        f.joints[joint::LEFT_KNEE + s] = make_joint(knees[s], v);
        f.joints[joint::LEFT_ANKLE + s] = make_joint(ankles[s], v);
        f.joints[joint::LEFT_HEEL + s] = make_joint(ankles[s] + Eigen::Vector3f(0.0f, 0.02f, 0.03f), v);
        f.joints[joint::LEFT_FOOT_INDEX + s] = make_joint(ankles[s] + Eigen::Vector3f(0.0f, 0.03f, -0.08f), v);
    }

    return f;
}

inline std::vector<Frame> repeat_pose(const PoseParams& p, size_t count) {
    return std::vector<Frame>(count, build_pose(p));
}

// ============================================================================
// Repetition generator
// ============================================================================
class SyntheticGenerator {
private:
    std::mt19937 rng;
    float noise_std;

public:
    SyntheticGenerator(unsigned seed = 42, float noise = 0.002f)
        : rng(seed), noise_std(noise) {}

    // Progress through a repetition of `period` frames: 0 at rest, 1 at the peak
    static float rep_phase(size_t t, size_t period) {
        if (period == 0) return 0.0f;
        float phase = static_cast<float>(t % period) / period;
        return 0.5f - 0.5f * std::cos(2.0f * 3.14159265358979f * phase);
    }

    std::vector<Frame> generate(ExerciseLabel exercise, size_t frames, size_t period = 60) {
        std::vector<Frame> out;
        out.reserve(frames);
        for (size_t t = 0; t < frames; ++t) {
            out.push_back(jitter(build_pose(params_at(exercise, rep_phase(t, period)))));
        }
        return out;
    }

    static PoseParams params_at(ExerciseLabel exercise, float a) {
        PoseParams p;
        switch (exercise) {
            case ExerciseLabel::DeepSquat:
                p.left_knee_angle = p.right_knee_angle = 170.0f - 75.0f * a;
                p.knee_half_width = 0.10f + 0.03f * a;
                p.lean = 0.3f * a;
                break;
            case ExerciseLabel::HurdleStep:
                p.left_ankle_lift = 0.25f * a;
                p.left_knee_angle = 178.0f - 60.0f * a;
                break;
            case ExerciseLabel::InlineLunge:
                p.left_ankle_depth = -0.4f;
                p.left_knee_angle = 170.0f - 70.0f * a;
                p.right_knee_angle = 170.0f - 60.0f * a;
                p.knee_half_width = p.ankle_half_width = 0.05f;
                break;
            case ExerciseLabel::SideLunge:
                p.ankle_half_width = 0.275f;
                p.knee_half_width = 0.24f;
                p.left_knee_angle = 175.0f - 65.0f * a;
                break;
            case ExerciseLabel::SitToStand:
                p.left_knee_angle = p.right_knee_angle = 100.0f + 75.0f * a;
                p.ankle_half_width = 0.125f;
                p.knee_half_width = 0.13f;
                break;
            case ExerciseLabel::StandingActiveStraightLegRaise:
                p.left_ankle_lift = 0.3f * a;
                p.left_ankle_depth = -0.2f * a;
                break;
            case ExerciseLabel::StandingShoulderAbduction:
                p.arm_elevation = 90.0f * a;
                break;
            case ExerciseLabel::StandingShoulderExtension:
                p.arm_elevation = 30.0f * a;
                break;
            case ExerciseLabel::StandingShoulderRotation:
                p.elbow_angle = 90.0f;
                break;
            case ExerciseLabel::StandingShoulderScaption:
                p.arm_elevation = 85.0f * a;
                break;
            case ExerciseLabel::NoExerciseDetected:
                break;
        }
        return p;
    }

private:
    Frame jitter(Frame f) {
        if (noise_std <= 0.0f) return f;
        std::normal_distribution<float> noise(0.0f, noise_std);
        for (auto& j : f.joints) {
            j.x += noise(rng);
            j.y += noise(rng);
            j.z += noise(rng);
        }
        return f;
    }
};

} // namespace ortho
