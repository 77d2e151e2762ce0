// ============================================================================
// apps/ortho_synthetic.cpp - Generate synthetic exercise recordings
// ============================================================================
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <chrono>

#include "../src/ortho_types.hpp"
#include "../src/data/synthetic_pose.hpp"

using namespace ortho;

// One row per frame: timestamp then x,y,z,visibility for each joint
bool write_csv(const std::string& filename, const std::vector<Frame>& frames, float rate_hz) {
    std::ofstream file(filename);
    if (!file) {
        std::cerr << "Error: Cannot create " << filename << "\n";
        return false;
    }

    file << "timestamp";
    for (size_t j = 0; j < NUM_JOINTS; ++j) {
        file << ",j" << j << "_x,j" << j << "_y,j" << j << "_z,j" << j << "_v";
    }
    file << "\n";

    float dt = 1.0f / rate_hz;
    for (size_t t = 0; t < frames.size(); ++t) {
        file << t * dt;
        for (const auto& j : frames[t].joints) {
            file << "," << j.x << "," << j.y << "," << j.z << "," << j.visibility;
        }
        file << "\n";
    }
    return file.good();
}

int main(int argc, char** argv) {
    std::cout << "\n╔════════════════════════════════════════╗\n";
    std::cout << "║   OrthoCore Synthetic Data Generator   ║\n";
    std::cout << "╚════════════════════════════════════════╝\n\n";

    std::string exercise_name = "Deep Squat";
    size_t frames = 300;
    size_t period = 60;
    float rate = 30.0f;
    float noise = 0.002f;
    std::string output = "synthetic_session.csv";
    unsigned seed = std::chrono::system_clock::now().time_since_epoch().count();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--exercise" && i + 1 < argc) {
            exercise_name = argv[++i];
        } else if (arg == "--frames" && i + 1 < argc) {
            frames = std::stoul(argv[++i]);
        } else if (arg == "--period" && i + 1 < argc) {
            period = std::stoul(argv[++i]);
        } else if (arg == "--rate" && i + 1 < argc) {
            rate = std::stof(argv[++i]);
        } else if (arg == "--noise" && i + 1 < argc) {
            noise = std::stof(argv[++i]);
        } else if (arg == "--output" && i + 1 < argc) {
            output = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = std::stoul(argv[++i]);
        } else if (arg == "--list") {
            std::cout << "Exercises:\n";
            for (ExerciseLabel l : LEGS_EXERCISES) std::cout << "  " << label_name(l) << "\n";
            for (ExerciseLabel l : ARMS_EXERCISES) std::cout << "  " << label_name(l) << "\n";
            return 0;
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n";
            std::cout << "Options:\n";
            std::cout << "  --exercise NAME  Exercise to perform (default: Deep Squat)\n";
            std::cout << "  --frames N       Frames to generate (default: 300)\n";
            std::cout << "  --period N       Frames per repetition (default: 60)\n";
            std::cout << "  --rate Hz        Frame rate (default: 30)\n";
            std::cout << "  --noise S        Joint jitter std dev (default: 0.002)\n";
            std::cout << "  --output FILE    Output CSV (default: synthetic_session.csv)\n";
            std::cout << "  --seed N         Random seed\n";
            std::cout << "  --list           List exercise names\n";
            return 0;
        }
    }

    ExerciseLabel exercise;
    if (!label_from_name(exercise_name, exercise)) {
        std::cerr << "Error: Unknown exercise '" << exercise_name << "' (see --list)\n";
        return 1;
    }

    std::cout << "Configuration:\n";
    std::cout << "  Exercise: " << label_name(exercise) << "\n";
    std::cout << "  Frames: " << frames << " (" << period << " per repetition)\n";
    std::cout << "  Rate: " << rate << " Hz\n";
    std::cout << "  Noise: " << noise << "\n";
    std::cout << "  Seed: " << seed << "\n\n";

    SyntheticGenerator generator(seed, noise);
    std::vector<Frame> recording = generator.generate(exercise, frames, period);

    if (!write_csv(output, recording, rate > 0.0f ? rate : 30.0f)) {
        return 1;
    }
    std::cout << "Saved " << recording.size() << " frames to: " << output << "\n\n";

    std::cout << "Next steps:\n";
    std::cout << "1. Analyse: ./ortho_analyze --csv " << output << " --timestamp\n";
    std::cout << "2. Replay:  ./ortho_live --csv " << output << " --timestamp\n";

    return 0;
}
