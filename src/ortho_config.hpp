// ============================================================================
// ortho_config.hpp - Configuration for the OrthoCore analysis pipeline
// ============================================================================
#pragma once
#include <cstddef>

namespace ortho {

struct WindowConfig {
    size_t window_size = 60;        // W, frames per window
    size_t step = 15;               // S, batch stride
    size_t min_frames_ready = 30;   // Live buffer readiness
    float min_joint_visibility = 0.5f;
    float window_visible_ratio = 0.7f;
};

struct EnsembleConfig {
    float confidence_gate = 0.60f;

    // Deep-squat override
    float squat_knee_angle_max = 135.0f;
    float squat_knee_angle_deep = 110.0f;
    float squat_hip_ankle_range_min = 0.10f;

    // Lunge/squat symmetry override
    float lunge_ankle_depth_min = 0.20f;
};

struct EvaluatorConfig {
    // Deep squat (temporal)
    float squat_depth_max_angle = 100.0f;
    float squat_knee_width_ratio = 0.75f;
    float squat_lean_max = 0.70f;
    size_t smoothing_capacity = 10;

    // Per-frame rules
    float torso_shift_max = 0.12f;
    float ear_shoulder_min = 0.12f;
    float wrist_asymmetry_max = 0.15f;
    float trunk_lean_max_deg = 20.0f;
    float pelvic_tilt_max = 0.10f;
    float stance_knee_min_deg = 150.0f;
    float front_knee_min_deg = 70.0f;
    float knee_width_ratio = 0.75f;
    float raised_knee_min_deg = 160.0f;
    float arm_elevation_max_deg = 100.0f;
    float elbow_straight_min_deg = 150.0f;
    float elbow_drift_max = 0.15f;
    float rotation_elbow_min_deg = 60.0f;
    float rotation_elbow_max_deg = 120.0f;
};

struct SessionConfig {
    float vote_confidence = 0.50f;
};

struct FeedbackConfig {
    float debounce_seconds = 4.0f;
    float poll_seconds = 1.0f;      // Worker wake-up interval while idle
};

struct LiveConfig {
    size_t setup_frames = 90;        // ~3 s at 30 fps
    size_t calibration_frames = 150; // ~5 s at 30 fps
    size_t prediction_interval = 5;
};

struct OrthoConfig {
    WindowConfig window;
    EnsembleConfig ensemble;
    EvaluatorConfig evaluator;
    SessionConfig session;
    FeedbackConfig feedback;
    LiveConfig live;
    bool verbose = false;
};

} // namespace ortho
