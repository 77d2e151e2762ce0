// ============================================================================
// session/verdict_json.hpp - JSON form of a session verdict
// ============================================================================
#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "session_aggregator.hpp"

namespace ortho {

inline nlohmann::json classification_to_json(const ClassificationResult& c) {
    nlohmann::json j;
    j["label"] = label_name(c.label);
    j["confidence"] = c.confidence;
    j["source"] = source_name(c.source);
    return j;
}

inline nlohmann::json window_to_json(const WindowAnalysis& w) {
    nlohmann::json j;
    j["classification"] = classification_to_json(w.classification);
    j["is_correct"] = w.diagnostic.is_correct;
    j["violations"] = w.diagnostic.violations;
    j["window_visible"] = w.window_visible;
    return j;
}

// {exercise, confidence, is_correct, feedback, text_report}; non-ok outcomes
// carry only {error}
inline nlohmann::json verdict_to_json(const SessionVerdict& v, bool include_windows = false) {
    nlohmann::json j;
    if (!v.ok()) {
        j["error"] = v.error;
        return j;
    }

    j["exercise"] = label_name(v.locked_exercise);
    j["confidence"] = v.voting_confidence;
    j["is_correct"] = v.is_correct;
    if (v.feedback.empty()) {
        j["feedback"] = MOVEMENT_CORRECT;
    } else {
        j["feedback"] = v.feedback;
    }
    j["text_report"] = v.text_report;

    if (include_windows) {
        nlohmann::json windows = nlohmann::json::array();
        for (const auto& w : v.window_results) {
            windows.push_back(window_to_json(w));
        }
        j["windows"] = windows;
    }
    return j;
}

} // namespace ortho
