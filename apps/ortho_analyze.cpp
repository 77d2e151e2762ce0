// ============================================================================
// apps/ortho_analyze.cpp - Analyse a recorded exercise session from CSV
// ============================================================================
#include <iostream>
#include <string>
#include <vector>
#include <iomanip>

#include "../src/ortho_types.hpp"
#include "../src/ortho_config.hpp"
#include "../src/io/pose_csv_reader.hpp"
#include "../src/utils/config_parser.hpp"
#include "../src/classifier/template_classifier.hpp"
#include "../src/session/session_aggregator.hpp"
#include "../src/session/verdict_json.hpp"

using namespace ortho;

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " --csv <file> [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --csv FILE       Pose recording, one frame per row (required)\n";
    std::cout << "  --config FILE    Configuration file (key: value)\n";
    std::cout << "  --no-header      CSV has no header row\n";
    std::cout << "  --timestamp      First CSV column is a timestamp\n";
    std::cout << "  --windows        Include per-window results in the output\n";
    std::cout << "  --verbose        Log window predictions and rule metrics\n";
    std::cout << "  --help           Show this message\n";
}

int main(int argc, char** argv) {
    std::string csv_file;
    std::string config_file;
    bool include_windows = false;
    bool verbose = false;
    PoseCSVConfig csv_config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--csv" && i + 1 < argc) {
            csv_file = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--no-header") {
            csv_config.has_header = false;
        } else if (arg == "--timestamp") {
            csv_config.has_timestamp = true;
        } else if (arg == "--windows") {
            include_windows = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (csv_file.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        OrthoConfig config;
        if (!config_file.empty()) {
            if (!ConfigParser::load_config(config_file, config)) {
                std::cerr << "Error: Cannot load config file: " << config_file << "\n";
                return 1;
            }
        }
        if (verbose) config.verbose = true;

        if (config.verbose) {
            std::cout << "\n╔════════════════════════════════════════╗\n";
            std::cout << "║       OrthoCore Session Analysis       ║\n";
            std::cout << "╚════════════════════════════════════════╝\n\n";
            std::cout << "Configuration:\n";
            std::cout << "  Window: " << config.window.window_size << " frames, step "
                      << config.window.step << "\n";
            std::cout << "  Confidence gate: " << config.ensemble.confidence_gate << "\n";
            std::cout << "  Vote threshold: " << config.session.vote_confidence << "\n";
        }

        PoseCSVReader reader(csv_config);
        if (!reader.load(csv_file, config.verbose)) {
            return 1;
        }

        auto session = make_session(config, make_legs_template_classifier(),
                                    make_arms_template_classifier());
        SessionVerdict verdict = session->analyze_recording(reader.get_frames());

        std::cout << verdict_to_json(verdict, include_windows).dump(2) << "\n";
        return verdict.ok() ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
