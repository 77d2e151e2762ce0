// ============================================================================
// session/session_aggregator.hpp - Per-session orchestration of windowing,
// classification, evaluation and majority voting
// ============================================================================
#pragma once
#include <vector>
#include <string>
#include <memory>
#include <optional>
#include <iomanip>
#include <sstream>
#include "../ortho_types.hpp"
#include "../ortho_config.hpp"
#include "../data/window_buffer.hpp"
#include "../classifier/ensemble_classifier.hpp"
#include "../diagnostics/biomechanical_evaluator.hpp"
#include "../diagnostics/report_generator.hpp"
#include "../utils/log.hpp"

namespace ortho {

struct WindowAnalysis {
    ClassificationResult classification;
    DiagnosticResult diagnostic;
    bool window_visible = false;
};

enum class AnalysisStatus {
    Ok,
    NoData,                 // No usable frames in the recording
    NoConfidentExercise     // Every window fell below the vote threshold
};

struct VoteTally {
    ExerciseLabel winner = ExerciseLabel::NoExerciseDetected;
    size_t winner_votes = 0;
    size_t total_votes = 0;
    std::vector<std::pair<ExerciseLabel, size_t>> counts;  // first-seen order

    float confidence() const {
        return total_votes > 0 ? static_cast<float>(winner_votes) / total_votes : 0.0f;
    }
};

// Majority vote; equal counts go to the label that was voted for first
inline VoteTally tally_votes(const std::vector<ExerciseLabel>& votes) {
    VoteTally tally;
    for (ExerciseLabel v : votes) {
        bool found = false;
        for (auto& entry : tally.counts) {
            if (entry.first == v) {
                entry.second++;
                found = true;
                break;
            }
        }
        if (!found) tally.counts.push_back({v, 1});
    }

    for (const auto& entry : tally.counts) {
        if (entry.second > tally.winner_votes) {
            tally.winner = entry.first;
            tally.winner_votes = entry.second;
        }
    }
    tally.total_votes = votes.size();
    return tally;
}

struct SessionVerdict {
    AnalysisStatus status = AnalysisStatus::NoData;
    std::string error;

    ExerciseLabel locked_exercise = ExerciseLabel::NoExerciseDetected;
    float voting_confidence = 0.0f;
    std::vector<ClassificationResult> discovery;     // pass 1, one per window
    std::vector<WindowAnalysis> window_results;      // pass 2, one per window

    // Mirrors the last window; text_report covers all of them
    bool is_correct = false;
    std::set<std::string> feedback;
    std::string text_report;

    bool ok() const { return status == AnalysisStatus::Ok; }
};

// ============================================================================
// Session aggregator
// ============================================================================
class SessionAggregator {
private:
    OrthoConfig config;
    EnsembleClassifier ensemble;
    BiomechanicalEvaluator evaluator;
    ReportGenerator reporter;
    WindowBuffer live_buffer;

public:
    SessionAggregator(const OrthoConfig& cfg,
                      std::shared_ptr<const PoseClassifier> legs,
                      std::shared_ptr<const PoseClassifier> arms)
        : config(cfg),
          ensemble(legs, arms, cfg.ensemble, cfg.verbose),
          evaluator(cfg.evaluator, cfg.verbose),
          live_buffer(cfg.window) {}

    // ------------------------------------------------------------------------
    // Live cadence
    // ------------------------------------------------------------------------
    bool push_frame(const Frame& frame) { return live_buffer.push(frame); }
    bool live_ready() const { return live_buffer.ready(); }
    bool live_full() const { return live_buffer.full(); }
    Window live_window() const { return live_buffer.snapshot(); }
    size_t frames_buffered() const { return live_buffer.size(); }

    WindowAnalysis analyze_window(const Window& window,
                                  const std::optional<ExerciseLabel>& forced_label = std::nullopt) {
        for (const auto& f : window.frames) {
            if (!has_valid_shape(f)) {
                return analyze_usable(window, forced_label);
            }
        }
        WindowAnalysis analysis;
        analysis.window_visible = window.window_visible;
        analysis.classification = ensemble.classify(window, forced_label);
        analysis.diagnostic = evaluator.evaluate(analysis.classification.label, window.frames);
        return analysis;
    }

    // Clears temporal state tied to the previously locked exercise
    void relock() {
        evaluator.reset();
    }

    void reset() {
        live_buffer.clear();
        evaluator.reset();
    }

    // ------------------------------------------------------------------------
    // Whole recording: discovery vote, then locked evaluation
    // ------------------------------------------------------------------------
    SessionVerdict analyze_recording(const std::vector<Frame>& frames) {
        SessionVerdict verdict;

        std::vector<Frame> usable;
        usable.reserve(frames.size());
        for (const auto& f : frames) {
            if (has_valid_shape(f)) {
                usable.push_back(f);
            }
        }
        if (usable.size() != frames.size()) {
            log::warn("Session", "skipped " + std::to_string(frames.size() - usable.size()) +
                      " malformed frames");
        }

        std::vector<Window> windows = make_batch_windows(usable, config.window);
        if (windows.empty()) {
            verdict.status = AnalysisStatus::NoData;
            verdict.error = "No person detected";
            return verdict;
        }

        // Pass 1: discovery
        std::vector<ExerciseLabel> votes;
        for (const auto& window : windows) {
            ClassificationResult res = ensemble.classify(window);
            verdict.discovery.push_back(res);
            if (res.confidence > config.session.vote_confidence &&
                res.label != ExerciseLabel::NoExerciseDetected) {
                votes.push_back(res.label);
            }
        }

        if (config.verbose) {
            log_discovery(verdict.discovery);
        }

        if (votes.empty()) {
            verdict.status = AnalysisStatus::NoConfidentExercise;
            verdict.error = "No exercise detected with sufficient confidence.";
            return verdict;
        }

        VoteTally tally = tally_votes(votes);
        verdict.locked_exercise = tally.winner;
        verdict.voting_confidence = tally.confidence();

        if (config.verbose) {
            std::ostringstream ss;
            ss << "locked " << label_name(tally.winner) << " with "
               << tally.winner_votes << "/" << tally.total_votes << " votes";
            log::info("Session", ss.str());
        }

        // Pass 2: locked evaluation
        relock();
        std::vector<DiagnosticResult> diagnostics;
        for (const auto& window : windows) {
            WindowAnalysis analysis = analyze_window(window, verdict.locked_exercise);
            diagnostics.push_back(analysis.diagnostic);
            verdict.window_results.push_back(analysis);
        }

        const DiagnosticResult& last = diagnostics.back();
        verdict.is_correct = last.is_correct;
        verdict.feedback = last.violations;
        verdict.text_report = reporter.generate(verdict.locked_exercise, diagnostics);
        verdict.status = AnalysisStatus::Ok;
        return verdict;
    }

    const OrthoConfig& get_config() const { return config; }
    const EnsembleClassifier& get_ensemble() const { return ensemble; }
    const BiomechanicalEvaluator& get_evaluator() const { return evaluator; }

private:
    // Drops frames with the wrong joint count before classification
    WindowAnalysis analyze_usable(const Window& window, const std::optional<ExerciseLabel>& forced_label) {
        std::vector<Frame> usable;
        for (const auto& f : window.frames) {
            if (has_valid_shape(f)) usable.push_back(f);
        }
        log::warn("Session", "window has " + std::to_string(window.frames.size() - usable.size()) +
                  " malformed frames");

        if (usable.empty()) {
            WindowAnalysis analysis;
            analysis.diagnostic = evaluator.evaluate(ExerciseLabel::NoExerciseDetected, usable);
            return analysis;
        }
        return analyze_window(make_window(std::move(usable), config.window), forced_label);
    }

    void log_discovery(const std::vector<ClassificationResult>& results) const {
        log::info("Session", "window predictions (" + std::to_string(results.size()) + " windows):");
        for (size_t i = 0; i < results.size(); ++i) {
            const auto& r = results[i];
            bool accepted = r.confidence > config.session.vote_confidence &&
                            r.label != ExerciseLabel::NoExerciseDetected;
            std::ostringstream ss;
            ss << "  window " << (i + 1) << ": " << label_name(r.label)
               << " (" << std::fixed << std::setprecision(1) << r.confidence * 100.0f << "%) "
               << (accepted ? "[OK]" : "[REJECTED]");
            log::info("Session", ss.str());
        }
    }
};

// One aggregator per session; only the classifiers are shared
inline std::unique_ptr<SessionAggregator> make_session(const OrthoConfig& config,
                                                       std::shared_ptr<const PoseClassifier> legs,
                                                       std::shared_ptr<const PoseClassifier> arms) {
    return std::make_unique<SessionAggregator>(config, legs, arms);
}

} // namespace ortho
