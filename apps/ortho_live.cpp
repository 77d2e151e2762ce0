// ============================================================================
// apps/ortho_live.cpp - Replay a pose stream through the live pipeline with
// spoken feedback
// ============================================================================
#include <iostream>
#include <string>
#include <vector>
#include <thread>
#include <chrono>
#include <memory>

#include "../src/ortho_types.hpp"
#include "../src/ortho_config.hpp"
#include "../src/io/pose_csv_reader.hpp"
#include "../src/utils/config_parser.hpp"
#include "../src/classifier/template_classifier.hpp"
#include "../src/session/session_aggregator.hpp"
#include "../src/session/live_session.hpp"
#include "../src/feedback/feedback_channel.hpp"

using namespace ortho;

int main(int argc, char** argv) {
    std::string csv_file;
    std::string config_file;
    float fps = 30.0f;
    bool realtime = false;
    bool mute = false;
    PoseCSVConfig csv_config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--csv" && i + 1 < argc) {
            csv_file = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--fps" && i + 1 < argc) {
            fps = std::stof(argv[++i]);
        } else if (arg == "--realtime") {
            realtime = true;
        } else if (arg == "--mute") {
            mute = true;
        } else if (arg == "--no-header") {
            csv_config.has_header = false;
        } else if (arg == "--timestamp") {
            csv_config.has_timestamp = true;
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " --csv <file> [options]\n";
            std::cout << "Options:\n";
            std::cout << "  --csv FILE       Pose stream to replay (required)\n";
            std::cout << "  --config FILE    Configuration file (key: value)\n";
            std::cout << "  --fps N          Replay rate (default: 30)\n";
            std::cout << "  --realtime       Sleep between frames at the replay rate\n";
            std::cout << "  --mute           Disable spoken feedback\n";
            std::cout << "  --no-header      CSV has no header row\n";
            std::cout << "  --timestamp      First CSV column is a timestamp\n";
            return 0;
        }
    }

    if (csv_file.empty()) {
        std::cerr << "Error: --csv is required (see --help)\n";
        return 1;
    }

    std::cout << "\n╔════════════════════════════════════════╗\n";
    std::cout << "║         OrthoCore Live Replay          ║\n";
    std::cout << "╚════════════════════════════════════════╝\n\n";

    try {
        OrthoConfig config;
        if (!config_file.empty() && !ConfigParser::load_config(config_file, config)) {
            std::cerr << "Error: Cannot load config file: " << config_file << "\n";
            return 1;
        }

        PoseCSVReader reader(csv_config);
        if (!reader.load(csv_file, config.verbose)) {
            return 1;
        }
        std::cout << "Replaying " << reader.get_frame_count() << " frames at " << fps << " fps\n";
        std::cout << "Setup " << config.live.setup_frames << " frames, calibration "
                  << config.live.calibration_frames << " frames\n\n";

        auto session = make_session(config, make_legs_template_classifier(),
                                    make_arms_template_classifier());
        LiveSession live(*session, config.live);

        std::shared_ptr<Announcer> announcer;
        if (mute) {
            announcer = std::make_shared<UnavailableAnnouncer>();
        } else {
            announcer = std::make_shared<ConsoleAnnouncer>();
        }
        FeedbackChannel voice(announcer, config.feedback);

        auto frame_time = std::chrono::microseconds(static_cast<long>(1e6f / (fps > 0.0f ? fps : 30.0f)));
        LivePhase last_phase = live.current_phase();
        size_t analyzed = 0;
        size_t correct = 0;

        for (const auto& frame : reader.get_frames()) {
            LiveTick tick = live.push(frame);

            if (tick.phase != last_phase) {
                log::info("Live", "phase " + phase_name(tick.phase));
                last_phase = tick.phase;
            }

            if (tick.analyzed && tick.phase == LivePhase::Training) {
                analyzed++;
                if (tick.analysis.diagnostic.is_correct) correct++;
            }
            if (!tick.feedback.empty()) {
                voice.enqueue(tick.feedback);
            }

            if (realtime) {
                std::this_thread::sleep_for(frame_time);
            }
        }

        voice.wait_idle(std::chrono::milliseconds(5000));
        voice.stop();

        std::cout << "\nSummary:\n";
        std::cout << "─────────────────────────────\n";
        if (live.is_locked()) {
            std::cout << "Exercise:        " << label_name(live.get_locked_exercise()) << "\n";
            std::cout << "Evaluated ticks: " << analyzed << "\n";
            std::cout << "Correct ticks:   " << correct << "\n";
        } else {
            std::cout << "No exercise locked (" << live.vote_count() << " calibration votes)\n";
        }
        std::cout << "Announcements:   " << voice.delivered_count() << " delivered, "
                  << voice.debounced_count() << " debounced\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
