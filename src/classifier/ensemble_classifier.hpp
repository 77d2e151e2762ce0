// ============================================================================
// classifier/ensemble_classifier.hpp - Legs/arms model fusion with
// geometry override rules
// ============================================================================
#pragma once
#include <memory>
#include <optional>
#include <cmath>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include "pose_classifier.hpp"
#include "../geometry/geometry_kit.hpp"
#include "../ortho_config.hpp"
#include "../utils/log.hpp"

namespace ortho {

// Window-level geometry consulted by the override rules
struct WindowGeometry {
    float mean_min_knee_angle = 180.0f;
    float hip_ankle_gap_range = 0.0f;
    float mean_ankle_depth_diff = 0.0f;
};

inline WindowGeometry measure_window(const Window& window) {
    WindowGeometry g;
    if (window.empty()) return g;

    float knee_sum = 0.0f;
    float depth_sum = 0.0f;
    float gap_min = 0.0f;
    float gap_max = 0.0f;
    size_t counted = 0;

    for (const Frame& f : window.frames) {
        if (!has_valid_shape(f)) continue;
        knee_sum += geometry::min_knee_angle(f);
        depth_sum += std::abs(f[joint::LEFT_ANKLE].z - f[joint::RIGHT_ANKLE].z);

        float gap = geometry::ankle_mid(f).y() - geometry::hip_mid(f).y();
        if (counted == 0) {
            gap_min = gap_max = gap;
        } else {
            gap_min = std::min(gap_min, gap);
            gap_max = std::max(gap_max, gap);
        }
        counted++;
    }
    if (counted == 0) return g;

    float n = static_cast<float>(counted);
    g.mean_min_knee_angle = knee_sum / n;
    g.mean_ankle_depth_diff = depth_sum / n;
    g.hip_ankle_gap_range = gap_max - gap_min;
    return g;
}

// ============================================================================
// Ensemble classifier
// ============================================================================
class EnsembleClassifier {
private:
    std::shared_ptr<const PoseClassifier> legs_model;
    std::shared_ptr<const PoseClassifier> arms_model;
    EnsembleConfig config;
    bool verbose;

public:
    EnsembleClassifier(std::shared_ptr<const PoseClassifier> legs,
                       std::shared_ptr<const PoseClassifier> arms,
                       const EnsembleConfig& cfg,
                       bool verbose_log = false)
        : legs_model(legs ? legs : std::make_shared<UnavailableClassifier>(ExerciseFamily::Legs)),
          arms_model(arms ? arms : std::make_shared<UnavailableClassifier>(ExerciseFamily::Arms)),
          config(cfg),
          verbose(verbose_log) {}

    // Bypasses inference entirely
    ClassificationResult classify_locked(ExerciseLabel forced_label) const {
        ClassificationResult result;
        result.label = forced_label;
        result.confidence = 1.0f;
        result.source = SourceModel::Locked;
        return result;
    }

    ClassificationResult classify(const Window& window,
                                  const std::optional<ExerciseLabel>& forced_label = std::nullopt) const {
        if (forced_label) {
            return classify_locked(*forced_label);
        }

        LegDecision legs = run_leg(*legs_model, window);
        LegDecision arms = run_leg(*arms_model, window);

        ClassificationResult result;
        if (arms.confidence > legs.confidence) {
            result.label = arms.label;
            result.confidence = arms.confidence;
            result.source = SourceModel::Arms;
        } else {
            result.label = legs.label;
            result.confidence = legs.confidence;
            result.source = SourceModel::Legs;
        }

        WindowGeometry geo = measure_window(window);
        apply_overrides(result, geo);

        if (verbose) {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(3)
               << "legs=" << label_name(legs.label) << " (" << legs.confidence << ")"
               << " arms=" << label_name(arms.label) << " (" << arms.confidence << ")"
               << " knee=" << geo.mean_min_knee_angle
               << " -> " << label_name(result.label) << " [" << source_name(result.source) << "]";
            log::info("Ensemble", ss.str());
        }

        // Confidence gate
        if (result.confidence < config.confidence_gate) {
            result.label = ExerciseLabel::NoExerciseDetected;
            result.source = SourceModel::None;
            result.confidence = 0.0f;
        }

        return result;
    }

    void apply_overrides(ClassificationResult& result, const WindowGeometry& geo) const {
        // Deep squats are often mistaken for standing/arms movements
        bool squat_geometry =
            (geo.mean_min_knee_angle < config.squat_knee_angle_max &&
             geo.hip_ankle_gap_range > config.squat_hip_ankle_range_min) ||
            geo.mean_min_knee_angle < config.squat_knee_angle_deep;

        if (squat_geometry && family_of(result.label) == ExerciseFamily::Arms) {
            result.label = ExerciseLabel::DeepSquat;
            result.source = SourceModel::LegsForced;
        }

        // Feet side by side in depth: a squat, not a lunge
        if (result.label == ExerciseLabel::InlineLunge &&
            geo.mean_ankle_depth_diff < config.lunge_ankle_depth_min) {
            result.label = ExerciseLabel::DeepSquat;
        }
    }

    const PoseClassifier& legs() const { return *legs_model; }
    const PoseClassifier& arms() const { return *arms_model; }

private:
    LegDecision run_leg(const PoseClassifier& model, const Window& window) const {
        if (!model.available() || window.empty()) {
            return LegDecision();
        }
        try {
            return derive_decision(model.predict(window), model.classes());
        } catch (const std::exception& e) {
            log::error("Ensemble", model.name() + " prediction failed: " + e.what());
            return LegDecision();
        } catch (...) {
            log::error("Ensemble", model.name() + " prediction failed: unknown error");
            return LegDecision();
        }
    }
};

} // namespace ortho
