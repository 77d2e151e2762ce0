// ============================================================================
// classifier/template_classifier.hpp - Pose classifier scoring per-frame
// geometric features against per-exercise templates
// ============================================================================
#pragma once
#include <vector>
#include <string>
#include <cmath>
#include <memory>
#include <algorithm>
#include "pose_classifier.hpp"
#include "../geometry/geometry_kit.hpp"

namespace ortho {

// Feature layout produced by extract_pose_features
namespace feature {
    constexpr size_t KNEE_ANGLE = 0;      // min knee angle / 180
    constexpr size_t KNEE_HEIGHT_DIFF = 1;
    constexpr size_t ANKLE_DEPTH_DIFF = 2;
    constexpr size_t ANKLE_SPREAD = 3;
    constexpr size_t ARM_ELEVATION = 4;   // max shoulder->elbow angle from down / 180
    constexpr size_t FOOT_RAISE = 5;
    constexpr size_t ELBOW_ANGLE = 6;     // min elbow angle / 180
    constexpr size_t FORWARD_REACH = 7;   // shoulder z - wrist z, averaged
    constexpr size_t COUNT = 8;
}

inline std::vector<float> extract_pose_features(const Frame& f) {
    using geometry::point;
    std::vector<float> x(feature::COUNT, 0.0f);

    x[feature::KNEE_ANGLE] = geometry::min_knee_angle(f) / 180.0f;
    x[feature::KNEE_HEIGHT_DIFF] = std::abs(f[joint::LEFT_KNEE].y - f[joint::RIGHT_KNEE].y);
    x[feature::ANKLE_DEPTH_DIFF] = std::abs(f[joint::LEFT_ANKLE].z - f[joint::RIGHT_ANKLE].z);
    x[feature::ANKLE_SPREAD] = std::abs(f[joint::LEFT_ANKLE].x - f[joint::RIGHT_ANKLE].x);

    float elev_l = geometry::angle_from_down(point(f[joint::LEFT_SHOULDER]), point(f[joint::LEFT_ELBOW]));
    float elev_r = geometry::angle_from_down(point(f[joint::RIGHT_SHOULDER]), point(f[joint::RIGHT_ELBOW]));
    x[feature::ARM_ELEVATION] = std::max(elev_l, elev_r) / 180.0f;

    x[feature::FOOT_RAISE] = std::abs(f[joint::LEFT_ANKLE].y - f[joint::RIGHT_ANKLE].y);

    float elbow_l = geometry::angle(f[joint::LEFT_SHOULDER], f[joint::LEFT_ELBOW], f[joint::LEFT_WRIST]);
    float elbow_r = geometry::angle(f[joint::RIGHT_SHOULDER], f[joint::RIGHT_ELBOW], f[joint::RIGHT_WRIST]);
    x[feature::ELBOW_ANGLE] = std::min(elbow_l, elbow_r) / 180.0f;

    x[feature::FORWARD_REACH] = 0.5f * ((f[joint::LEFT_SHOULDER].z - f[joint::LEFT_WRIST].z) +
                                        (f[joint::RIGHT_SHOULDER].z - f[joint::RIGHT_WRIST].z));
    return x;
}

struct ExerciseTemplate {
    ExerciseLabel label;
    std::vector<float> values;   // One per entry of the classifier's feature mask
};

class TemplateClassifier : public PoseClassifier {
private:
    ExerciseFamily fam;
    std::string model_name;
    std::vector<size_t> mask;
    std::vector<ExerciseTemplate> templates;
    std::vector<ExerciseLabel> labels;
    float temperature;

public:
    TemplateClassifier(ExerciseFamily family, const std::string& name,
                       const std::vector<size_t>& feature_mask,
                       const std::vector<ExerciseTemplate>& tmpl,
                       float temp = 0.02f)
        : fam(family), model_name(name), mask(feature_mask), templates(tmpl),
          temperature(temp > 0.0f ? temp : 0.02f) {
        for (const auto& t : templates) {
            labels.push_back(t.label);
        }
    }

    ExerciseFamily family() const override { return fam; }
    const std::vector<ExerciseLabel>& classes() const override { return labels; }
    bool available() const override { return !templates.empty(); }
    std::string name() const override { return model_name; }

    // Softmax over negative squared template distances
    std::vector<float> frame_probabilities(const Frame& frame) const {
        std::vector<float> x = extract_pose_features(frame);
        std::vector<float> logits(templates.size(), 0.0f);

        for (size_t k = 0; k < templates.size(); ++k) {
            float d2 = 0.0f;
            for (size_t i = 0; i < mask.size() && i < templates[k].values.size(); ++i) {
                float diff = x[mask[i]] - templates[k].values[i];
                d2 += diff * diff;
            }
            logits[k] = -d2 / temperature;
        }

        float max_logit = *std::max_element(logits.begin(), logits.end());
        float sum = 0.0f;
        for (auto& l : logits) {
            l = std::exp(l - max_logit);
            sum += l;
        }
        for (auto& l : logits) {
            l /= sum;
        }
        return logits;
    }

    ModelOutput predict(const Window& window) const override {
        ModelOutput out;
        if (templates.empty()) return out;

        std::vector<size_t> votes(templates.size(), 0);
        for (const auto& frame : window.frames) {
            if (!has_valid_shape(frame)) continue;
            std::vector<float> p = frame_probabilities(frame);
            votes[std::max_element(p.begin(), p.end()) - p.begin()]++;
            out.per_frame_probabilities.push_back(std::move(p));
        }

        if (!out.per_frame_probabilities.empty()) {
            out.label = labels[std::max_element(votes.begin(), votes.end()) - votes.begin()];
        }
        return out;
    }
};

// ============================================================================
// Presets
// ============================================================================
inline std::shared_ptr<TemplateClassifier> make_legs_template_classifier() {
    std::vector<size_t> mask = {
        feature::KNEE_ANGLE, feature::KNEE_HEIGHT_DIFF, feature::ANKLE_DEPTH_DIFF,
        feature::ANKLE_SPREAD, feature::FOOT_RAISE
    };
    std::vector<ExerciseTemplate> templates = {
        {ExerciseLabel::DeepSquat,   {0.55f, 0.00f, 0.00f, 0.20f, 0.00f}},
        {ExerciseLabel::HurdleStep,  {0.75f, 0.20f, 0.05f, 0.15f, 0.25f}},
        {ExerciseLabel::InlineLunge, {0.55f, 0.10f, 0.40f, 0.10f, 0.00f}},
        {ExerciseLabel::SideLunge,   {0.60f, 0.05f, 0.05f, 0.55f, 0.00f}},
        {ExerciseLabel::SitToStand,  {0.70f, 0.00f, 0.00f, 0.25f, 0.00f}}
    };
    return std::make_shared<TemplateClassifier>(ExerciseFamily::Legs, "legs-template", mask, templates);
}

inline std::shared_ptr<TemplateClassifier> make_arms_template_classifier() {
    std::vector<size_t> mask = {
        feature::KNEE_ANGLE, feature::ARM_ELEVATION, feature::FOOT_RAISE,
        feature::ELBOW_ANGLE, feature::FORWARD_REACH
    };
    std::vector<ExerciseTemplate> templates = {
        {ExerciseLabel::StandingActiveStraightLegRaise, {1.00f, 0.10f, 0.30f, 0.95f,  0.00f}},
        {ExerciseLabel::StandingShoulderAbduction,      {1.00f, 0.50f, 0.00f, 0.95f,  0.00f}},
        {ExerciseLabel::StandingShoulderExtension,      {1.00f, 0.20f, 0.00f, 0.95f, -0.20f}},
        {ExerciseLabel::StandingShoulderRotation,       {1.00f, 0.10f, 0.00f, 0.50f,  0.10f}},
        {ExerciseLabel::StandingShoulderScaption,       {1.00f, 0.50f, 0.00f, 0.95f,  0.25f}}
    };
    return std::make_shared<TemplateClassifier>(ExerciseFamily::Arms, "arms-template", mask, templates);
}

} // namespace ortho
