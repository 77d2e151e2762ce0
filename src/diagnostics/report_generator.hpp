// ============================================================================
// diagnostics/report_generator.hpp - Narrative session report
// ============================================================================
#pragma once
#include <vector>
#include <string>
#include <map>
#include <sstream>
#include <iomanip>
#include <cmath>
#include "../ortho_types.hpp"

namespace ortho {

inline const std::map<std::string, std::string>& advice_table() {
    static const std::map<std::string, std::string> advice = {
        {"too shallow", "Lower your hips further until your thighs reach at least parallel."},
        {"knees too narrow", "Push your knees outward so they track over your toes."},
        {"excessive lean", "Keep your chest up and brace your core to stay upright."},
        {"torso instability", "Keep your torso centred over your hips and avoid swaying sideways."},
        {"shrugging", "Relax your shoulders down and away from your ears."},
        {"arm asymmetry", "Move both arms together at the same speed and height."},
        {"excessive trunk lean", "Stand tall with a neutral spine instead of leaning."},
        {"pelvic tilt", "Keep your hips level by engaging the glutes of the standing leg."},
        {"stance knee flexion", "Keep the standing knee straight and stable."},
        {"front knee over-flexed", "Shorten the bend of the front knee and keep it above the ankle."},
        {"raised knee bent", "Keep the lifted leg straight through the whole raise."},
        {"arm raised too high", "Stop when your arms are level with your shoulders."},
        {"elbow bent", "Keep your elbows straight throughout the movement."},
        {"arm drifting sideways", "Keep the arm moving straight back, close to your side."},
        {"elbow angle drift", "Hold the elbow at a right angle while rotating."},
        {"elbow away from torso", "Keep your elbow tucked against your side."},
        {NO_ACTIVE_EXERCISE, "Make sure your whole body is visible to the camera."}
    };
    return advice;
}

class ReportGenerator {
public:
    // Scores every window; names the most frequent violation (first seen wins ties)
    std::string generate(ExerciseLabel exercise, const std::vector<DiagnosticResult>& results) const {
        std::ostringstream report;
        report << "Exercise: " << label_name(exercise) << "\n";

        if (results.empty()) {
            report << "No movement windows were analysed.\n";
            return report.str();
        }

        size_t correct = 0;
        std::vector<std::string> order;
        std::map<std::string, size_t> counts;

        for (const auto& r : results) {
            if (r.is_correct) correct++;
            for (const auto& v : r.violations) {
                if (counts[v]++ == 0) order.push_back(v);
            }
        }

        std::string top;
        size_t top_count = 0;
        for (const auto& v : order) {
            if (counts[v] > top_count) {
                top = v;
                top_count = counts[v];
            }
        }

        float score = 100.0f * correct / results.size();
        report << "Score: " << static_cast<int>(std::round(score)) << "% ("
               << correct << "/" << results.size() << " windows correct)\n";

        if (score > 90.0f) {
            report << "Excellent form! Your technique was consistently correct.";
            if (!top.empty()) {
                report << " Minor note: " << top << ".";
            }
            report << "\n";
        } else if (score > 60.0f) {
            report << "Good effort. Most of the movement was performed correctly";
            if (!top.empty()) {
                report << ", but watch out for: " << top;
            }
            report << ".\n";
        } else {
            report << "Technique needs improvement.";
            if (!top.empty()) {
                report << " The most frequent issue was: " << top << ".";
            }
            report << "\n";
        }

        if (!top.empty()) {
            auto it = advice_table().find(top);
            if (it != advice_table().end()) {
                report << "Recommendation: " << it->second << "\n";
            } else {
                report << "Recommendation: Focus on correcting " << top << ".\n";
            }
        }

        return report.str();
    }
};

} // namespace ortho
