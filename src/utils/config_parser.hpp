// ============================================================================
// utils/config_parser.hpp - YAML-style configuration parser for OrthoCore
// ============================================================================
#pragma once
#include <fstream>
#include <sstream>
#include <string>
#include <map>
#include <iostream>
#include <stdexcept>
#include "../ortho_config.hpp"

namespace ortho {

class ConfigParser {
public:
    // Unknown keys are ignored; a malformed or out-of-range value aborts the
    // load and leaves `config` untouched
    static bool load_config(const std::string& filename, OrthoConfig& config) {
        std::ifstream file(filename);
        if (!file) {
            return false;
        }

        std::map<std::string, std::string> params;
        std::string line;

        while (std::getline(file, line)) {
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#') continue;

            // Parse key: value
            size_t colon_pos = line.find(':');
            if (colon_pos != std::string::npos) {
                std::string key = trim(line.substr(0, colon_pos));
                std::string value = trim(line.substr(colon_pos + 1));
                params[key] = value;
            }
        }

        OrthoConfig parsed = config;
        try {
            // Windowing
            read(params, "window_size", parsed.window.window_size);
            read(params, "step", parsed.window.step);
            read(params, "min_frames_ready", parsed.window.min_frames_ready);
            read(params, "min_joint_visibility", parsed.window.min_joint_visibility);
            read(params, "window_visible_ratio", parsed.window.window_visible_ratio);

            // Ensemble
            read(params, "confidence_gate", parsed.ensemble.confidence_gate);
            read(params, "squat_knee_angle_max", parsed.ensemble.squat_knee_angle_max);
            read(params, "squat_knee_angle_deep", parsed.ensemble.squat_knee_angle_deep);
            read(params, "squat_hip_ankle_range_min", parsed.ensemble.squat_hip_ankle_range_min);
            read(params, "lunge_ankle_depth_min", parsed.ensemble.lunge_ankle_depth_min);

            // Evaluator
            EvaluatorConfig& e = parsed.evaluator;
            read(params, "squat_depth_max_angle", e.squat_depth_max_angle);
            read(params, "squat_knee_width_ratio", e.squat_knee_width_ratio);
            read(params, "squat_lean_max", e.squat_lean_max);
            read(params, "smoothing_capacity", e.smoothing_capacity);
            read(params, "torso_shift_max", e.torso_shift_max);
            read(params, "ear_shoulder_min", e.ear_shoulder_min);
            read(params, "wrist_asymmetry_max", e.wrist_asymmetry_max);
            read(params, "trunk_lean_max_deg", e.trunk_lean_max_deg);
            read(params, "pelvic_tilt_max", e.pelvic_tilt_max);
            read(params, "stance_knee_min_deg", e.stance_knee_min_deg);
            read(params, "front_knee_min_deg", e.front_knee_min_deg);
            read(params, "knee_width_ratio", e.knee_width_ratio);
            read(params, "raised_knee_min_deg", e.raised_knee_min_deg);
            read(params, "arm_elevation_max_deg", e.arm_elevation_max_deg);
            read(params, "elbow_straight_min_deg", e.elbow_straight_min_deg);
            read(params, "elbow_drift_max", e.elbow_drift_max);
            read(params, "rotation_elbow_min_deg", e.rotation_elbow_min_deg);
            read(params, "rotation_elbow_max_deg", e.rotation_elbow_max_deg);

            // Session, feedback, live
            read(params, "vote_confidence", parsed.session.vote_confidence);
            read(params, "feedback_debounce_seconds", parsed.feedback.debounce_seconds);
            read(params, "feedback_poll_seconds", parsed.feedback.poll_seconds);
            read(params, "live_setup_frames", parsed.live.setup_frames);
            read(params, "live_calibration_frames", parsed.live.calibration_frames);
            read(params, "live_prediction_interval", parsed.live.prediction_interval);

            if (params.count("verbose")) {
                parsed.verbose = (params["verbose"] == "true" || params["verbose"] == "1");
            }

            validate(parsed);
        } catch (const std::exception& e) {
            std::cerr << "Error: invalid value in " << filename << ": " << e.what() << "\n";
            return false;
        }

        config = parsed;
        return true;
    }

    static bool save_config(const std::string& filename, const OrthoConfig& config) {
        std::ofstream file(filename);
        if (!file) {
            return false;
        }

        file << "# OrthoCore Configuration\n";
        file << "# Windowing\n";
        file << "window_size: " << config.window.window_size << "\n";
        file << "step: " << config.window.step << "\n";
        file << "min_frames_ready: " << config.window.min_frames_ready << "\n";
        file << "min_joint_visibility: " << config.window.min_joint_visibility << "\n";
        file << "window_visible_ratio: " << config.window.window_visible_ratio << "\n";
        file << "\n";

        file << "# Ensemble fusion\n";
        file << "confidence_gate: " << config.ensemble.confidence_gate << "\n";
        file << "squat_knee_angle_max: " << config.ensemble.squat_knee_angle_max << "\n";
        file << "squat_knee_angle_deep: " << config.ensemble.squat_knee_angle_deep << "\n";
        file << "squat_hip_ankle_range_min: " << config.ensemble.squat_hip_ankle_range_min << "\n";
        file << "lunge_ankle_depth_min: " << config.ensemble.lunge_ankle_depth_min << "\n";
        file << "\n";

        const EvaluatorConfig& e = config.evaluator;
        file << "# Deep squat\n";
        file << "squat_depth_max_angle: " << e.squat_depth_max_angle << "\n";
        file << "squat_knee_width_ratio: " << e.squat_knee_width_ratio << "\n";
        file << "squat_lean_max: " << e.squat_lean_max << "\n";
        file << "smoothing_capacity: " << e.smoothing_capacity << "\n";
        file << "\n";

        file << "# Per-frame rules\n";
        file << "torso_shift_max: " << e.torso_shift_max << "\n";
        file << "ear_shoulder_min: " << e.ear_shoulder_min << "\n";
        file << "wrist_asymmetry_max: " << e.wrist_asymmetry_max << "\n";
        file << "trunk_lean_max_deg: " << e.trunk_lean_max_deg << "\n";
        file << "pelvic_tilt_max: " << e.pelvic_tilt_max << "\n";
        file << "stance_knee_min_deg: " << e.stance_knee_min_deg << "\n";
        file << "front_knee_min_deg: " << e.front_knee_min_deg << "\n";
        file << "knee_width_ratio: " << e.knee_width_ratio << "\n";
        file << "raised_knee_min_deg: " << e.raised_knee_min_deg << "\n";
        file << "arm_elevation_max_deg: " << e.arm_elevation_max_deg << "\n";
        file << "elbow_straight_min_deg: " << e.elbow_straight_min_deg << "\n";
        file << "elbow_drift_max: " << e.elbow_drift_max << "\n";
        file << "rotation_elbow_min_deg: " << e.rotation_elbow_min_deg << "\n";
        file << "rotation_elbow_max_deg: " << e.rotation_elbow_max_deg << "\n";
        file << "\n";

        file << "# Session\n";
        file << "vote_confidence: " << config.session.vote_confidence << "\n";
        file << "\n";

        file << "# Feedback\n";
        file << "feedback_debounce_seconds: " << config.feedback.debounce_seconds << "\n";
        file << "feedback_poll_seconds: " << config.feedback.poll_seconds << "\n";
        file << "\n";

        file << "# Live stream\n";
        file << "live_setup_frames: " << config.live.setup_frames << "\n";
        file << "live_calibration_frames: " << config.live.calibration_frames << "\n";
        file << "live_prediction_interval: " << config.live.prediction_interval << "\n";
        file << "\n";

        file << "verbose: " << (config.verbose ? "true" : "false") << "\n";
        return file.good();
    }

    // Throws std::invalid_argument naming the first offending key
    static void validate(const OrthoConfig& config) {
        const WindowConfig& w = config.window;
        if (w.window_size == 0) {
            throw std::invalid_argument("window_size must be at least 1");
        }
        if (w.step == 0) {
            throw std::invalid_argument("step must be at least 1");
        }
        if (w.min_frames_ready == 0 || w.min_frames_ready > w.window_size) {
            throw std::invalid_argument("min_frames_ready must be in [1, window_size]");
        }
        if (config.evaluator.smoothing_capacity == 0) {
            throw std::invalid_argument("smoothing_capacity must be at least 1");
        }
        if (config.live.prediction_interval == 0) {
            throw std::invalid_argument("live_prediction_interval must be at least 1");
        }

        check_unit(w.min_joint_visibility, "min_joint_visibility");
        check_unit(w.window_visible_ratio, "window_visible_ratio");
        check_unit(config.ensemble.confidence_gate, "confidence_gate");
        check_unit(config.session.vote_confidence, "vote_confidence");

        if (config.feedback.debounce_seconds < 0.0f || config.feedback.poll_seconds <= 0.0f) {
            throw std::invalid_argument("feedback timings must be positive");
        }
    }

private:
    static void check_unit(float value, const std::string& key) {
        if (!(value >= 0.0f && value <= 1.0f)) {
            throw std::invalid_argument(key + " must be in [0, 1]");
        }
    }

    static void read(std::map<std::string, std::string>& params, const std::string& key, size_t& out) {
        if (!params.count(key)) return;
        const std::string& value = params[key];
        if (value.empty() || value[0] == '-') {
            throw std::invalid_argument(key + " must be a non-negative integer");
        }
        size_t used = 0;
        out = std::stoul(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(key + " must be a non-negative integer");
        }
    }

    static void read(std::map<std::string, std::string>& params, const std::string& key, float& out) {
        if (params.count(key)) out = std::stof(params[key]);
    }

    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (first == std::string::npos) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }
};

} // namespace ortho
