// ============================================================================
// classifier/pose_classifier.hpp - Pluggable window classifiers
// ============================================================================
#pragma once
#include <vector>
#include <string>
#include <memory>
#include <algorithm>
#include "../ortho_types.hpp"

namespace ortho {

// Raw output of one model on one window. per_frame_probabilities[t][k] is the
// probability of classes()[k] at frame t.
struct ModelOutput {
    ExerciseLabel label = ExerciseLabel::NoExerciseDetected;
    std::vector<std::vector<float>> per_frame_probabilities;
};

class PoseClassifier {
public:
    virtual ~PoseClassifier() = default;

    virtual ExerciseFamily family() const = 0;
    virtual const std::vector<ExerciseLabel>& classes() const = 0;
    virtual bool available() const = 0;
    virtual ModelOutput predict(const Window& window) const = 0;
    virtual std::string name() const = 0;
};

// Stands in for a model that could not be loaded
class UnavailableClassifier : public PoseClassifier {
private:
    ExerciseFamily fam;
    std::vector<ExerciseLabel> no_classes;

public:
    UnavailableClassifier(ExerciseFamily f) : fam(f) {}

    ExerciseFamily family() const override { return fam; }
    const std::vector<ExerciseLabel>& classes() const override { return no_classes; }
    bool available() const override { return false; }
    ModelOutput predict(const Window&) const override { return ModelOutput(); }
    std::string name() const override { return "unavailable"; }
};

// ============================================================================
// Window-level decision derived from per-frame probabilities
// ============================================================================
struct LegDecision {
    ExerciseLabel label = ExerciseLabel::NoExerciseDetected;
    float confidence = 0.0f;
};

// Majority of per-frame top-1 labels (ties go to the label seen first); the
// confidence is the mean top-class probability over frames agreeing with it.
inline LegDecision derive_decision(const ModelOutput& output,
                                   const std::vector<ExerciseLabel>& classes) {
    LegDecision decision;
    const auto& probs = output.per_frame_probabilities;
    if (probs.empty() || classes.empty()) {
        return decision;
    }

    std::vector<int> top_class(probs.size(), -1);
    std::vector<float> top_prob(probs.size(), 0.0f);
    std::vector<size_t> votes(classes.size(), 0);
    std::vector<size_t> first_seen(classes.size(), probs.size());

    for (size_t t = 0; t < probs.size(); ++t) {
        const auto& row = probs[t];
        size_t n = std::min(row.size(), classes.size());
        if (n == 0) continue;

        size_t best = 0;
        for (size_t k = 1; k < n; ++k) {
            if (row[k] > row[best]) best = k;
        }
        top_class[t] = static_cast<int>(best);
        top_prob[t] = row[best];
        votes[best]++;
        if (first_seen[best] == probs.size()) first_seen[best] = t;
    }

    int winner = -1;
    for (size_t k = 0; k < classes.size(); ++k) {
        if (votes[k] == 0) continue;
        if (winner < 0 || votes[k] > votes[winner] ||
            (votes[k] == votes[winner] && first_seen[k] < first_seen[winner])) {
            winner = static_cast<int>(k);
        }
    }
    if (winner < 0) {
        return decision;
    }

    float sum = 0.0f;
    size_t count = 0;
    for (size_t t = 0; t < probs.size(); ++t) {
        if (top_class[t] == winner) {
            sum += top_prob[t];
            count++;
        }
    }

    decision.label = classes[winner];
    decision.confidence = count > 0 ? sum / count : 0.0f;
    return decision;
}

} // namespace ortho
