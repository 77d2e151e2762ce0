// ============================================================================
// session/live_session.hpp - Live stream: setup, calibration vote, then
// locked evaluation of every prediction tick
// ============================================================================
#pragma once
#include <vector>
#include <string>
#include "session_aggregator.hpp"

namespace ortho {

enum class LivePhase {
    Setup,
    Calibration,
    Training
};

inline std::string phase_name(LivePhase phase) {
    switch (phase) {
        case LivePhase::Setup: return "SETUP";
        case LivePhase::Calibration: return "CALIBRATION";
        case LivePhase::Training: return "TRAINING";
    }
    return "SETUP";
}

struct LiveTick {
    LivePhase phase = LivePhase::Setup;
    bool analyzed = false;          // A prediction ran on this frame
    bool locked = false;
    ExerciseLabel locked_exercise = ExerciseLabel::NoExerciseDetected;
    WindowAnalysis analysis;
    std::string feedback;           // Message for the user, empty when none
};

class LiveSession {
private:
    SessionAggregator& session;
    LiveConfig config;

    size_t phase_frame = 0;         // Frames since the current calibration cycle began
    size_t frame_count = 0;
    bool locked = false;
    ExerciseLabel locked_exercise = ExerciseLabel::NoExerciseDetected;
    std::vector<ExerciseLabel> calibration_votes;

public:
    LiveSession(SessionAggregator& s, const LiveConfig& cfg) : session(s), config(cfg) {}

    LiveTick push(const Frame& frame) {
        LiveTick tick;
        tick.phase = current_phase();

        if (!session.push_frame(frame)) {
            tick.locked = locked;
            tick.locked_exercise = locked_exercise;
            return tick;
        }

        bool predict = session.live_full() &&
                       config.prediction_interval > 0 &&
                       frame_count % config.prediction_interval == 0;
        frame_count++;
        phase_frame++;

        if (predict && tick.phase != LivePhase::Setup) {
            Window window = session.live_window();
            if (!window.window_visible) {
                tick.feedback = "No pose detected - ensure full body is visible";
            } else if (tick.phase == LivePhase::Calibration) {
                tick.analysis = session.analyze_window(window);
                tick.analyzed = true;
                const auto& c = tick.analysis.classification;
                if (c.label != ExerciseLabel::NoExerciseDetected && c.confidence > 0.0f) {
                    calibration_votes.push_back(c.label);
                }
            } else if (ensure_locked()) {
                tick.analysis = session.analyze_window(window, locked_exercise);
                tick.analyzed = true;
                tick.feedback = feedback_for(tick.analysis.diagnostic);
            }
        }

        tick.locked = locked;
        tick.locked_exercise = locked_exercise;
        return tick;
    }

    LivePhase current_phase() const {
        if (locked) return LivePhase::Training;
        if (phase_frame < config.setup_frames) return LivePhase::Setup;
        if (phase_frame < config.setup_frames + config.calibration_frames) return LivePhase::Calibration;
        return LivePhase::Training;
    }

    bool is_locked() const { return locked; }
    ExerciseLabel get_locked_exercise() const { return locked_exercise; }
    size_t vote_count() const { return calibration_votes.size(); }

private:
    // Locks the calibration majority; with no votes the cycle starts over
    bool ensure_locked() {
        if (locked) return true;

        if (calibration_votes.empty()) {
            log::info("Live", "no exercise recognised during calibration, restarting");
            phase_frame = 0;
            return false;
        }

        VoteTally tally = tally_votes(calibration_votes);
        locked_exercise = tally.winner;
        locked = true;
        session.relock();
        log::info("Live", "locked exercise: " + label_name(locked_exercise));
        return true;
    }

    static std::string feedback_for(const DiagnosticResult& d) {
        if (d.is_correct || d.violations.empty()) return "";
        return *d.violations.begin();
    }
};

} // namespace ortho
