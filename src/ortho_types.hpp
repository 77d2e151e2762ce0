// ============================================================================
// ortho_types.hpp - Pose frames, windows and analysis results
// ============================================================================
#pragma once
#include <vector>
#include <string>
#include <set>
#include <stdexcept>

namespace ortho {

// MediaPipe pose topology
constexpr size_t NUM_JOINTS = 33;

namespace joint {
    constexpr size_t NOSE = 0;
    constexpr size_t LEFT_EAR = 7;
    constexpr size_t RIGHT_EAR = 8;
    constexpr size_t LEFT_SHOULDER = 11;
    constexpr size_t RIGHT_SHOULDER = 12;
    constexpr size_t LEFT_ELBOW = 13;
    constexpr size_t RIGHT_ELBOW = 14;
    constexpr size_t LEFT_WRIST = 15;
    constexpr size_t RIGHT_WRIST = 16;
    constexpr size_t LEFT_HIP = 23;
    constexpr size_t RIGHT_HIP = 24;
    constexpr size_t LEFT_KNEE = 25;
    constexpr size_t RIGHT_KNEE = 26;
    constexpr size_t LEFT_ANKLE = 27;
    constexpr size_t RIGHT_ANKLE = 28;
    constexpr size_t LEFT_HEEL = 29;
    constexpr size_t RIGHT_HEEL = 30;
    constexpr size_t LEFT_FOOT_INDEX = 31;
    constexpr size_t RIGHT_FOOT_INDEX = 32;
}

// Joints that must be visible for a frame to count as visible
const size_t CORE_JOINTS[] = {
    joint::LEFT_SHOULDER, joint::RIGHT_SHOULDER,
    joint::LEFT_HIP, joint::RIGHT_HIP,
    joint::LEFT_KNEE, joint::RIGHT_KNEE,
    joint::LEFT_ANKLE, joint::RIGHT_ANKLE
};

// ============================================================================
// Errors
// ============================================================================
class InputShapeError : public std::runtime_error {
public:
    InputShapeError(const std::string& what) : std::runtime_error(what) {}
};

// ============================================================================
// Frames and windows
// ============================================================================
struct Joint {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float visibility = 1.0f;
};

struct Frame {
    std::vector<Joint> joints;

    const Joint& operator[](size_t i) const { return joints[i]; }
    size_t size() const { return joints.size(); }
};

inline bool has_valid_shape(const Frame& frame) {
    return frame.joints.size() == NUM_JOINTS;
}

// Throws InputShapeError when the frame does not carry exactly NUM_JOINTS joints
inline void check_frame_shape(const Frame& frame) {
    if (!has_valid_shape(frame)) {
        throw InputShapeError("Frame has " + std::to_string(frame.joints.size()) +
                              " joints, expected " + std::to_string(NUM_JOINTS));
    }
}

inline bool is_frame_visible(const Frame& frame, float min_visibility) {
    for (size_t idx : CORE_JOINTS) {
        if (frame[idx].visibility < min_visibility) return false;
    }
    return true;
}

struct Window {
    std::vector<Frame> frames;
    bool window_visible = false;

    size_t size() const { return frames.size(); }
    bool empty() const { return frames.empty(); }
};

// ============================================================================
// Exercise catalogue
// ============================================================================
enum class ExerciseLabel {
    DeepSquat,
    HurdleStep,
    InlineLunge,
    SideLunge,
    SitToStand,
    StandingActiveStraightLegRaise,
    StandingShoulderAbduction,
    StandingShoulderExtension,
    StandingShoulderRotation,
    StandingShoulderScaption,
    NoExerciseDetected
};

enum class ExerciseFamily {
    Legs,
    Arms,
    None
};

const ExerciseLabel LEGS_EXERCISES[] = {
    ExerciseLabel::DeepSquat,
    ExerciseLabel::HurdleStep,
    ExerciseLabel::InlineLunge,
    ExerciseLabel::SideLunge,
    ExerciseLabel::SitToStand
};

const ExerciseLabel ARMS_EXERCISES[] = {
    ExerciseLabel::StandingActiveStraightLegRaise,
    ExerciseLabel::StandingShoulderAbduction,
    ExerciseLabel::StandingShoulderExtension,
    ExerciseLabel::StandingShoulderRotation,
    ExerciseLabel::StandingShoulderScaption
};

inline ExerciseFamily family_of(ExerciseLabel label) {
    switch (label) {
        case ExerciseLabel::DeepSquat:
        case ExerciseLabel::HurdleStep:
        case ExerciseLabel::InlineLunge:
        case ExerciseLabel::SideLunge:
        case ExerciseLabel::SitToStand:
            return ExerciseFamily::Legs;
        case ExerciseLabel::StandingActiveStraightLegRaise:
        case ExerciseLabel::StandingShoulderAbduction:
        case ExerciseLabel::StandingShoulderExtension:
        case ExerciseLabel::StandingShoulderRotation:
        case ExerciseLabel::StandingShoulderScaption:
            return ExerciseFamily::Arms;
        case ExerciseLabel::NoExerciseDetected:
            return ExerciseFamily::None;
    }
    return ExerciseFamily::None;
}

inline std::string label_name(ExerciseLabel label) {
    switch (label) {
        case ExerciseLabel::DeepSquat: return "Deep Squat";
        case ExerciseLabel::HurdleStep: return "Hurdle Step";
        case ExerciseLabel::InlineLunge: return "Inline Lunge";
        case ExerciseLabel::SideLunge: return "Side Lunge";
        case ExerciseLabel::SitToStand: return "Sit to Stand";
        case ExerciseLabel::StandingActiveStraightLegRaise: return "Standing Active Straight Leg Raise";
        case ExerciseLabel::StandingShoulderAbduction: return "Standing Shoulder Abduction";
        case ExerciseLabel::StandingShoulderExtension: return "Standing Shoulder Extension";
        case ExerciseLabel::StandingShoulderRotation: return "Standing Shoulder Int/Ext Rotation";
        case ExerciseLabel::StandingShoulderScaption: return "Standing Shoulder Scaption";
        case ExerciseLabel::NoExerciseDetected: return "No Exercise Detected";
    }
    return "No Exercise Detected";
}

// Reverse lookup; returns false for unknown names
inline bool label_from_name(const std::string& name, ExerciseLabel& out) {
    for (ExerciseLabel l : LEGS_EXERCISES) {
        if (label_name(l) == name) { out = l; return true; }
    }
    for (ExerciseLabel l : ARMS_EXERCISES) {
        if (label_name(l) == name) { out = l; return true; }
    }
    if (name == label_name(ExerciseLabel::NoExerciseDetected)) {
        out = ExerciseLabel::NoExerciseDetected;
        return true;
    }
    return false;
}

// ============================================================================
// Results
// ============================================================================
enum class SourceModel {
    Legs,
    Arms,
    LegsForced,
    Locked,
    None
};

inline std::string source_name(SourceModel source) {
    switch (source) {
        case SourceModel::Legs: return "Legs";
        case SourceModel::Arms: return "Arms";
        case SourceModel::LegsForced: return "Legs (forced)";
        case SourceModel::Locked: return "Locked";
        case SourceModel::None: return "None";
    }
    return "None";
}

struct ClassificationResult {
    ExerciseLabel label = ExerciseLabel::NoExerciseDetected;
    float confidence = 0.0f;
    SourceModel source = SourceModel::None;
};

struct DiagnosticResult {
    bool is_correct = false;
    std::set<std::string> violations;
};

const char* const NO_ACTIVE_EXERCISE = "no active exercise detected";
const char* const MOVEMENT_CORRECT = "Movement correct.";

} // namespace ortho
