// ============================================================================
// tests/test_ensemble.cpp - Classifier fusion, gating and override rules
// ============================================================================
#include <iostream>
#include <vector>
#include <memory>
#include <stdexcept>
#include <iterator>
#include "test_helpers.hpp"
#include "../src/classifier/ensemble_classifier.hpp"
#include "../src/classifier/template_classifier.hpp"
#include "../src/data/window_buffer.hpp"
#include "../src/data/synthetic_pose.hpp"

using namespace ortho;

// Emits the same probability row for every frame
class ScriptedClassifier : public PoseClassifier {
private:
    ExerciseFamily fam;
    std::vector<ExerciseLabel> labels;
    std::vector<float> row;

public:
    ScriptedClassifier(ExerciseFamily f, const std::vector<float>& probs)
        : fam(f), row(probs) {
        if (f == ExerciseFamily::Legs) {
            labels.assign(std::begin(LEGS_EXERCISES), std::end(LEGS_EXERCISES));
        } else {
            labels.assign(std::begin(ARMS_EXERCISES), std::end(ARMS_EXERCISES));
        }
    }

    ExerciseFamily family() const override { return fam; }
    const std::vector<ExerciseLabel>& classes() const override { return labels; }
    bool available() const override { return true; }
    std::string name() const override { return "scripted"; }

    ModelOutput predict(const Window& window) const override {
        ModelOutput out;
        out.per_frame_probabilities.assign(window.size(), row);
        return out;
    }
};

class ThrowingClassifier : public ScriptedClassifier {
public:
    ThrowingClassifier() : ScriptedClassifier(ExerciseFamily::Arms, {1.0f, 0.0f, 0.0f, 0.0f, 0.0f}) {}
    ModelOutput predict(const Window&) const override {
        throw std::runtime_error("inference backend crashed");
    }
};

class RawThrowingClassifier : public ScriptedClassifier {
public:
    RawThrowingClassifier() : ScriptedClassifier(ExerciseFamily::Arms, {1.0f, 0.0f, 0.0f, 0.0f, 0.0f}) {}
    ModelOutput predict(const Window&) const override {
        throw 42;
    }
};

std::shared_ptr<ScriptedClassifier> legs_model(size_t index, float p) {
    std::vector<float> row(5, (1.0f - p) / 4.0f);
    row[index] = p;
    return std::make_shared<ScriptedClassifier>(ExerciseFamily::Legs, row);
}

std::shared_ptr<ScriptedClassifier> arms_model(size_t index, float p) {
    std::vector<float> row(5, (1.0f - p) / 4.0f);
    row[index] = p;
    return std::make_shared<ScriptedClassifier>(ExerciseFamily::Arms, row);
}

Window pose_window(const PoseParams& p, size_t frames = 60) {
    return make_window(repeat_pose(p, frames), WindowConfig());
}

PoseParams squat_pose() {
    PoseParams p;
    p.left_knee_angle = p.right_knee_angle = 95.0f;
    p.knee_half_width = 0.12f;
    p.lean = 0.3f;
    return p;
}

void test_forced_label() {
    std::cout << "\n--- Testing forced label ---\n";

    EnsembleClassifier ensemble(legs_model(0, 0.3f), arms_model(0, 0.3f), EnsembleConfig());
    ClassificationResult r = ensemble.classify(pose_window(PoseParams()), ExerciseLabel::SideLunge);
    check(r.label == ExerciseLabel::SideLunge && r.confidence == 1.0f && r.source == SourceModel::Locked,
          "Forced label bypasses inference", "got " + label_name(r.label));
}

void test_confidence_gate() {
    std::cout << "\n--- Testing confidence gate ---\n";

    EnsembleClassifier ensemble(legs_model(1, 0.55f), arms_model(2, 0.45f), EnsembleConfig());
    ClassificationResult r = ensemble.classify(pose_window(PoseParams()));
    check(r.label == ExerciseLabel::NoExerciseDetected && r.confidence == 0.0f && r.source == SourceModel::None,
          "Both models below 0.60", "got " + label_name(r.label) + " " + std::to_string(r.confidence));

    EnsembleClassifier passing(legs_model(1, 0.60f), arms_model(2, 0.45f), EnsembleConfig());
    r = passing.classify(pose_window(PoseParams()));
    check(r.label == ExerciseLabel::HurdleStep && approx_equal(r.confidence, 0.60f),
          "Confidence equal to the gate passes", "got " + label_name(r.label));
}

void test_fusion() {
    std::cout << "\n--- Testing fusion ---\n";

    EnsembleClassifier tie(legs_model(1, 0.7f), arms_model(1, 0.7f), EnsembleConfig());
    ClassificationResult r = tie.classify(pose_window(PoseParams()));
    check(r.label == ExerciseLabel::HurdleStep && r.source == SourceModel::Legs,
          "Equal confidence goes to legs", "got " + label_name(r.label));

    EnsembleClassifier arms_wins(legs_model(1, 0.7f), arms_model(1, 0.8f), EnsembleConfig());
    r = arms_wins.classify(pose_window(PoseParams()));
    check(r.label == ExerciseLabel::StandingShoulderAbduction && r.source == SourceModel::Arms &&
          approx_equal(r.confidence, 0.8f),
          "Strictly higher arms confidence wins", "got " + label_name(r.label));
}

void test_deep_squat_override() {
    std::cout << "\n--- Testing deep squat override ---\n";

    EnsembleClassifier ensemble(legs_model(1, 0.65f), arms_model(1, 0.9f), EnsembleConfig());

    ClassificationResult r = ensemble.classify(pose_window(squat_pose()));
    check(r.label == ExerciseLabel::DeepSquat && r.source == SourceModel::LegsForced &&
          approx_equal(r.confidence, 0.9f),
          "Deep knee flexion overrides an arms label", "got " + label_name(r.label));

    // Mean 130 degrees with 0.15 of vertical hip travel
    PoseParams up;
    up.left_knee_angle = up.right_knee_angle = 160.0f;
    PoseParams down;
    down.left_knee_angle = down.right_knee_angle = 100.0f;
    std::vector<Frame> frames;
    for (size_t i = 0; i < 30; ++i) {
        frames.push_back(build_pose(up));
        frames.push_back(build_pose(down));
    }
    Window moving = make_window(frames, WindowConfig());
    WindowGeometry geo = measure_window(moving);
    check(approx_equal(geo.mean_min_knee_angle, 130.0f, 0.1f) && geo.hip_ankle_gap_range > 0.10f,
          "Window geometry of a moving squat", "mean " + std::to_string(geo.mean_min_knee_angle) +
          " range " + std::to_string(geo.hip_ankle_gap_range));

    r = ensemble.classify(moving);
    check(r.label == ExerciseLabel::DeepSquat && r.source == SourceModel::LegsForced,
          "Moderate flexion with hip travel overrides", "got " + label_name(r.label));

    PoseParams held;
    held.left_knee_angle = held.right_knee_angle = 130.0f;
    r = ensemble.classify(pose_window(held));
    check(r.label == ExerciseLabel::StandingShoulderAbduction && r.source == SourceModel::Arms,
          "Static moderate flexion keeps the arms label", "got " + label_name(r.label));

    EnsembleClassifier legs_win(legs_model(1, 0.9f), arms_model(1, 0.7f), EnsembleConfig());
    r = legs_win.classify(pose_window(squat_pose()));
    check(r.label == ExerciseLabel::HurdleStep && r.source == SourceModel::Legs,
          "Legs labels are never overridden to squat", "got " + label_name(r.label));
}

void test_lunge_override() {
    std::cout << "\n--- Testing lunge override ---\n";

    EnsembleClassifier ensemble(legs_model(2, 0.8f), arms_model(0, 0.3f), EnsembleConfig());

    ClassificationResult r = ensemble.classify(pose_window(PoseParams()));
    check(r.label == ExerciseLabel::DeepSquat && r.source == SourceModel::Legs,
          "Lunge with level feet becomes a squat", "got " + label_name(r.label));

    PoseParams lunge;
    lunge.left_ankle_depth = -0.4f;
    r = ensemble.classify(pose_window(lunge));
    check(r.label == ExerciseLabel::InlineLunge, "Staggered feet keep the lunge",
          "got " + label_name(r.label));
}

void test_unavailable_models() {
    std::cout << "\n--- Testing unavailable models ---\n";

    EnsembleClassifier legs_only(legs_model(3, 0.75f), nullptr, EnsembleConfig());
    ClassificationResult r = legs_only.classify(pose_window(PoseParams()));
    check(r.label == ExerciseLabel::SideLunge && !legs_only.arms().available(),
          "Missing arms model is skipped", "got " + label_name(r.label));

    EnsembleClassifier none(nullptr, nullptr, EnsembleConfig());
    r = none.classify(pose_window(PoseParams()));
    check(r.label == ExerciseLabel::NoExerciseDetected, "No models gives no exercise",
          "got " + label_name(r.label));

    EnsembleClassifier crashing(legs_model(4, 0.7f), std::make_shared<ThrowingClassifier>(), EnsembleConfig());
    r = crashing.classify(pose_window(PoseParams()));
    check(r.label == ExerciseLabel::SitToStand && r.source == SourceModel::Legs,
          "Failing model contributes nothing", "got " + label_name(r.label));

    EnsembleClassifier raw(legs_model(4, 0.7f), std::make_shared<RawThrowingClassifier>(), EnsembleConfig());
    r = raw.classify(pose_window(PoseParams()));
    check(r.label == ExerciseLabel::SitToStand && r.source == SourceModel::Legs,
          "Non-standard exception from a model is contained", "got " + label_name(r.label));

    Frame short_frame;
    short_frame.joints.resize(10);
    Window truncated;
    truncated.frames.assign(5, short_frame);
    EnsembleClassifier guarded(legs_model(4, 0.7f), nullptr, EnsembleConfig());
    r = guarded.classify(truncated);
    check(r.label == ExerciseLabel::SitToStand && r.source == SourceModel::Legs,
          "Override geometry ignores truncated frames", "got " + label_name(r.label));

    EnsembleClassifier empty(legs_model(4, 0.9f), nullptr, EnsembleConfig());
    r = empty.classify(Window());
    check(r.label == ExerciseLabel::NoExerciseDetected, "Empty window gives no exercise",
          "got " + label_name(r.label));
}

void test_derive_decision() {
    std::cout << "\n--- Testing window decision ---\n";

    std::vector<ExerciseLabel> classes = {ExerciseLabel::DeepSquat, ExerciseLabel::HurdleStep};

    ModelOutput tied;
    tied.per_frame_probabilities = {{0.8f, 0.2f}, {0.1f, 0.9f}, {0.3f, 0.7f}, {0.6f, 0.4f}};
    LegDecision d = derive_decision(tied, classes);
    check(d.label == ExerciseLabel::DeepSquat && approx_equal(d.confidence, 0.7f),
          "Tied vote goes to the label seen first", "got " + label_name(d.label) +
          " " + std::to_string(d.confidence));

    ModelOutput majority;
    majority.per_frame_probabilities = {{0.8f, 0.2f}, {0.1f, 0.9f}, {0.3f, 0.7f}};
    d = derive_decision(majority, classes);
    check(d.label == ExerciseLabel::HurdleStep && approx_equal(d.confidence, 0.8f),
          "Majority label with mean agreeing confidence", "got " + label_name(d.label));

    d = derive_decision(ModelOutput(), classes);
    check(d.label == ExerciseLabel::NoExerciseDetected && d.confidence == 0.0f,
          "No frames gives no decision", "got " + label_name(d.label));
}

void test_template_classifiers() {
    std::cout << "\n--- Testing template classifiers ---\n";

    auto legs = make_legs_template_classifier();
    auto arms = make_arms_template_classifier();

    Window squat = pose_window(squat_pose());
    LegDecision d = derive_decision(legs->predict(squat), legs->classes());
    check(d.label == ExerciseLabel::DeepSquat, "Legs templates recognise a squat",
          "got " + label_name(d.label));

    std::vector<float> probs = legs->frame_probabilities(squat.frames[0]);
    float sum = 0.0f;
    for (float p : probs) sum += p;
    check(probs.size() == 5 && approx_equal(sum, 1.0f, 1e-3f), "Template probabilities sum to one",
          "sum " + std::to_string(sum));

    EnsembleClassifier ensemble(legs, arms, EnsembleConfig());
    ClassificationResult r = ensemble.classify(squat);
    check(r.label == ExerciseLabel::DeepSquat && r.confidence >= 0.60f,
          "Ensemble of templates classifies a squat", "got " + label_name(r.label) +
          " " + std::to_string(r.confidence));
}

int main() {
    print_banner("OrthoCore Ensemble Tests");

    try {
        test_forced_label();
        test_confidence_gate();
        test_fusion();
        test_deep_squat_override();
        test_lunge_override();
        test_unavailable_models();
        test_derive_decision();
        test_template_classifiers();

        std::cout << "\n✅ All tests passed!\n\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
