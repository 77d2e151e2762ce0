// ============================================================================
// io/pose_csv_reader.hpp - Pose recordings stored as CSV, one frame per row
// ============================================================================
#pragma once
#include <fstream>
#include <sstream>
#include <vector>
#include <string>
#include <cmath>
#include <iostream>
#include <iomanip>
#include "../ortho_types.hpp"

namespace ortho {

struct PoseCSVConfig {
    bool has_header = true;
    bool has_timestamp = false;  // First column is timestamp
    char delimiter = ',';
};

// Rows hold 33 joints as x,y,z (99 columns, visibility 1) or
// x,y,z,visibility (132 columns)
class PoseCSVReader {
private:
    PoseCSVConfig config;
    std::vector<std::string> header;
    std::vector<Frame> frames;
    size_t values_per_joint = 0;

public:
    PoseCSVReader(const PoseCSVConfig& cfg = PoseCSVConfig()) : config(cfg) {}

    // Returns false when the file cannot be opened. Throws InputShapeError
    // on a row of the wrong width.
    bool load(const std::string& filename, bool verbose = false) {
        std::ifstream file(filename);
        if (!file) {
            std::cerr << "Error: Cannot open CSV file: " << filename << "\n";
            return false;
        }
        return load(file, verbose);
    }

    bool load(std::istream& in, bool verbose = false) {
        frames.clear();
        header.clear();
        values_per_joint = 0;

        std::string line;
        size_t line_num = 0;

        if (config.has_header && std::getline(in, line)) {
            parse_header(line);
            line_num++;
        }

        while (std::getline(in, line)) {
            line_num++;
            if (line.empty() || line == "\r") continue;
            frames.push_back(parse_row(line, line_num));
        }

        if (verbose) {
            print_stats();
        }
        return true;
    }

    const std::vector<Frame>& get_frames() const { return frames; }
    const std::vector<std::string>& get_header() const { return header; }
    size_t get_frame_count() const { return frames.size(); }
    size_t get_values_per_joint() const { return values_per_joint; }

private:
    void parse_header(const std::string& line) {
        std::stringstream ss(line);
        std::string col;
        while (std::getline(ss, col, config.delimiter)) {
            col.erase(0, col.find_first_not_of(" \t\r\n"));
            col.erase(col.find_last_not_of(" \t\r\n") + 1);
            header.push_back(col);
        }
    }

    Frame parse_row(const std::string& line, size_t line_num) {
        std::vector<float> values;
        std::stringstream ss(line);
        std::string value;
        size_t col = 0;

        while (std::getline(ss, value, config.delimiter)) {
            if (config.has_timestamp && col == 0) {
                col++;
                continue;
            }
            values.push_back(parse_value(value, line_num, col));
            col++;
        }

        size_t per_joint = 0;
        if (values.size() == NUM_JOINTS * 3) {
            per_joint = 3;
        } else if (values.size() == NUM_JOINTS * 4) {
            per_joint = 4;
        } else {
            throw InputShapeError("line " + std::to_string(line_num) + ": expected " +
                                  std::to_string(NUM_JOINTS * 3) + " or " +
                                  std::to_string(NUM_JOINTS * 4) + " values, got " +
                                  std::to_string(values.size()));
        }

        if (values_per_joint == 0) {
            values_per_joint = per_joint;
        }

        Frame frame;
        frame.joints.resize(NUM_JOINTS);
        for (size_t j = 0; j < NUM_JOINTS; ++j) {
            const float* v = &values[j * per_joint];
            frame.joints[j].x = v[0];
            frame.joints[j].y = v[1];
            frame.joints[j].z = v[2];
            frame.joints[j].visibility = (per_joint == 4) ? v[3] : 1.0f;
        }
        return frame;
    }

    float parse_value(const std::string& str, size_t line_num, size_t col) {
        std::string value = str;
        value.erase(0, value.find_first_not_of(" \t\r\n\""));
        value.erase(value.find_last_not_of(" \t\r\n\"") + 1);

        float val = 0.0f;
        try {
            val = std::stof(value);
        } catch (const std::exception&) {
            throw InputShapeError("line " + std::to_string(line_num) + ", col " +
                                  std::to_string(col) + ": invalid value '" + value + "'");
        }
        if (std::isnan(val) || std::isinf(val)) {
            throw InputShapeError("line " + std::to_string(line_num) + ", col " +
                                  std::to_string(col) + ": non-finite value");
        }
        return val;
    }

    void print_stats() const {
        std::cout << "\nPose CSV Statistics:\n";
        std::cout << "  Frames: " << frames.size() << "\n";
        std::cout << "  Values per joint: " << values_per_joint << "\n";
        if (config.has_timestamp) {
            std::cout << "  Timestamp: skipped (first column)\n";
        }
        if (frames.empty()) return;

        size_t visible = 0;
        for (const auto& f : frames) {
            if (is_frame_visible(f, 0.5f)) visible++;
        }
        std::cout << "  Fully visible frames: " << visible << " ("
                  << std::fixed << std::setprecision(1)
                  << 100.0f * visible / frames.size() << "%)\n";
    }
};

} // namespace ortho
