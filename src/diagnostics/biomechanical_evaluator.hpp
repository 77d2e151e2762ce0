// ============================================================================
// diagnostics/biomechanical_evaluator.hpp - Per-exercise movement rules
//
// Every exercise except Deep Squat is checked frame by frame against a table
// of named predicates. Deep Squat is judged at the deepest point of the window
// with a smoothed torso-lean metric.
// ============================================================================
#pragma once
#include <vector>
#include <string>
#include <functional>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include "smoothing_buffer.hpp"
#include "../geometry/geometry_kit.hpp"
#include "../ortho_types.hpp"
#include "../ortho_config.hpp"
#include "../utils/log.hpp"

namespace ortho {

// ============================================================================
// Frame predicates
// ============================================================================
namespace rules {

using geometry::point;

inline bool torso_shift(const Frame& f, const EvaluatorConfig& c) {
    return std::abs(geometry::shoulder_mid(f).x() - geometry::hip_mid(f).x()) > c.torso_shift_max;
}

inline bool shrugging(const Frame& f, const EvaluatorConfig& c) {
    float left = geometry::distance(f[joint::LEFT_EAR], f[joint::LEFT_SHOULDER]);
    float right = geometry::distance(f[joint::RIGHT_EAR], f[joint::RIGHT_SHOULDER]);
    return std::min(left, right) < c.ear_shoulder_min;
}

inline bool arm_asymmetry(const Frame& f, const EvaluatorConfig& c) {
    return std::abs(f[joint::LEFT_WRIST].y - f[joint::RIGHT_WRIST].y) > c.wrist_asymmetry_max;
}

inline bool trunk_lean(const Frame& f, const EvaluatorConfig& c) {
    return geometry::angle_from_vertical(geometry::hip_mid(f), geometry::shoulder_mid(f)) > c.trunk_lean_max_deg;
}

inline bool pelvic_tilt(const Frame& f, const EvaluatorConfig& c) {
    return std::abs(f[joint::LEFT_HIP].y - f[joint::RIGHT_HIP].y) > c.pelvic_tilt_max;
}

// Stance leg is the one whose ankle sits lower in the image
inline bool stance_knee_flexion(const Frame& f, const EvaluatorConfig& c) {
    bool left_stance = f[joint::LEFT_ANKLE].y >= f[joint::RIGHT_ANKLE].y;
    float knee = left_stance ? geometry::left_knee_angle(f) : geometry::right_knee_angle(f);
    return knee < c.stance_knee_min_deg;
}

inline bool raised_knee_bent(const Frame& f, const EvaluatorConfig& c) {
    bool left_raised = f[joint::LEFT_ANKLE].y < f[joint::RIGHT_ANKLE].y;
    float knee = left_raised ? geometry::left_knee_angle(f) : geometry::right_knee_angle(f);
    return knee < c.raised_knee_min_deg;
}

inline bool front_knee_overflexed(const Frame& f, const EvaluatorConfig& c) {
    return geometry::min_knee_angle(f) < c.front_knee_min_deg;
}

inline bool knees_too_narrow(const Frame& f, const EvaluatorConfig& c) {
    return geometry::knee_distance(f) < c.knee_width_ratio * geometry::ankle_distance(f);
}

inline bool arm_too_high(const Frame& f, const EvaluatorConfig& c) {
    float left = geometry::angle_from_down(point(f[joint::LEFT_SHOULDER]), point(f[joint::LEFT_ELBOW]));
    float right = geometry::angle_from_down(point(f[joint::RIGHT_SHOULDER]), point(f[joint::RIGHT_ELBOW]));
    return std::max(left, right) > c.arm_elevation_max_deg;
}

inline float left_elbow_angle(const Frame& f) {
    return geometry::angle(f[joint::LEFT_SHOULDER], f[joint::LEFT_ELBOW], f[joint::LEFT_WRIST]);
}

inline float right_elbow_angle(const Frame& f) {
    return geometry::angle(f[joint::RIGHT_SHOULDER], f[joint::RIGHT_ELBOW], f[joint::RIGHT_WRIST]);
}

inline bool elbow_bent(const Frame& f, const EvaluatorConfig& c) {
    return std::min(left_elbow_angle(f), right_elbow_angle(f)) < c.elbow_straight_min_deg;
}

inline bool elbow_drift(const Frame& f, const EvaluatorConfig& c) {
    float left = std::abs(f[joint::LEFT_ELBOW].x - f[joint::LEFT_SHOULDER].x);
    float right = std::abs(f[joint::RIGHT_ELBOW].x - f[joint::RIGHT_SHOULDER].x);
    return std::max(left, right) > c.elbow_drift_max;
}

inline bool elbow_angle_drift(const Frame& f, const EvaluatorConfig& c) {
    for (float a : {left_elbow_angle(f), right_elbow_angle(f)}) {
        if (a < c.rotation_elbow_min_deg || a > c.rotation_elbow_max_deg) return true;
    }
    return false;
}

} // namespace rules

struct FrameRule {
    std::string violation;
    std::function<bool(const Frame&, const EvaluatorConfig&)> check;
};

// Rule table for exercises judged frame by frame. Deep Squat and the
// sentinel have no per-frame table.
inline std::vector<FrameRule> frame_rules_for(ExerciseLabel label) {
    switch (label) {
        case ExerciseLabel::HurdleStep:
            return {
                {"torso instability", rules::torso_shift},
                {"pelvic tilt", rules::pelvic_tilt},
                {"stance knee flexion", rules::stance_knee_flexion}
            };
        case ExerciseLabel::InlineLunge:
            return {
                {"torso instability", rules::torso_shift},
                {"excessive trunk lean", rules::trunk_lean},
                {"front knee over-flexed", rules::front_knee_overflexed}
            };
        case ExerciseLabel::SideLunge:
            return {
                {"excessive trunk lean", rules::trunk_lean},
                {"front knee over-flexed", rules::front_knee_overflexed}
            };
        case ExerciseLabel::SitToStand:
            return {
                {"torso instability", rules::torso_shift},
                {"knees too narrow", rules::knees_too_narrow}
            };
        case ExerciseLabel::StandingActiveStraightLegRaise:
            return {
                {"torso instability", rules::torso_shift},
                {"pelvic tilt", rules::pelvic_tilt},
                {"raised knee bent", rules::raised_knee_bent}
            };
        case ExerciseLabel::StandingShoulderAbduction:
            return {
                {"shrugging", rules::shrugging},
                {"arm asymmetry", rules::arm_asymmetry},
                {"torso instability", rules::torso_shift},
                {"arm raised too high", rules::arm_too_high}
            };
        case ExerciseLabel::StandingShoulderExtension:
            return {
                {"shrugging", rules::shrugging},
                {"torso instability", rules::torso_shift},
                {"elbow bent", rules::elbow_bent},
                {"arm drifting sideways", rules::elbow_drift}
            };
        case ExerciseLabel::StandingShoulderRotation:
            return {
                {"shrugging", rules::shrugging},
                {"torso instability", rules::torso_shift},
                {"elbow angle drift", rules::elbow_angle_drift},
                {"elbow away from torso", rules::elbow_drift}
            };
        case ExerciseLabel::StandingShoulderScaption:
            return {
                {"shrugging", rules::shrugging},
                {"arm asymmetry", rules::arm_asymmetry},
                {"torso instability", rules::torso_shift},
                {"elbow bent", rules::elbow_bent}
            };
        case ExerciseLabel::DeepSquat:
        case ExerciseLabel::NoExerciseDetected:
            return {};
    }
    return {};
}

// ============================================================================
// Evaluator
// ============================================================================
class BiomechanicalEvaluator {
private:
    EvaluatorConfig config;
    SmoothingBuffer lean_buffer;
    bool verbose;

public:
    BiomechanicalEvaluator(const EvaluatorConfig& cfg, bool verbose_log = false)
        : config(cfg), lean_buffer(cfg.smoothing_capacity), verbose(verbose_log) {}

    DiagnosticResult evaluate(ExerciseLabel label, const std::vector<Frame>& frames) {
        if (frames.empty()) {
            return no_active_exercise();
        }

        switch (label) {
            case ExerciseLabel::DeepSquat:
                return evaluate_squat(frames);
            case ExerciseLabel::HurdleStep:
            case ExerciseLabel::InlineLunge:
            case ExerciseLabel::SideLunge:
            case ExerciseLabel::SitToStand:
            case ExerciseLabel::StandingActiveStraightLegRaise:
            case ExerciseLabel::StandingShoulderAbduction:
            case ExerciseLabel::StandingShoulderExtension:
            case ExerciseLabel::StandingShoulderRotation:
            case ExerciseLabel::StandingShoulderScaption:
                return evaluate_per_frame(frame_rules_for(label), frames);
            case ExerciseLabel::NoExerciseDetected:
                return no_active_exercise();
        }
        return no_active_exercise();
    }

    // Called whenever the session locks onto a (new) exercise
    void reset() {
        lean_buffer.clear();
    }

    const SmoothingBuffer& smoothing() const { return lean_buffer; }

private:
    static DiagnosticResult no_active_exercise() {
        DiagnosticResult result;
        result.is_correct = false;
        result.violations.insert(NO_ACTIVE_EXERCISE);
        return result;
    }

    DiagnosticResult evaluate_per_frame(const std::vector<FrameRule>& table,
                                        const std::vector<Frame>& frames) const {
        DiagnosticResult result;
        for (const auto& frame : frames) {
            for (const auto& rule : table) {
                if (rule.check(frame, config)) {
                    result.violations.insert(rule.violation);
                }
            }
        }
        result.is_correct = result.violations.empty();
        return result;
    }

    DiagnosticResult evaluate_squat(const std::vector<Frame>& frames) {
        DiagnosticResult result;

        // Deepest point of the repetition
        size_t deepest = 0;
        float min_angle = geometry::min_knee_angle(frames[0]);
        for (size_t t = 1; t < frames.size(); ++t) {
            float a = geometry::min_knee_angle(frames[t]);
            if (a < min_angle) {
                min_angle = a;
                deepest = t;
            }
        }
        const Frame& bottom = frames[deepest];

        if (min_angle > config.squat_depth_max_angle) {
            result.violations.insert("too shallow");
        }

        if (geometry::knee_distance(bottom) <
            config.squat_knee_width_ratio * geometry::ankle_distance(bottom)) {
            result.violations.insert("knees too narrow");
        }

        // Single-frame lean spikes are absorbed by the rolling mean
        float lean = geometry::torso_lean_ratio(bottom);
        lean_buffer.push(lean);
        float smoothed = lean_buffer.mean();
        if (smoothed > config.squat_lean_max) {
            result.violations.insert("excessive lean");
        }

        if (verbose) {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(3)
               << "squat min knee=" << min_angle << " deg at frame " << deepest
               << ", lean=" << lean << " smoothed=" << smoothed
               << " (" << lean_buffer.size() << "/" << lean_buffer.capacity() << ")";
            log::info("Evaluator", ss.str());
        }

        result.is_correct = result.violations.empty();
        return result;
    }
};

} // namespace ortho
