// ============================================================================
// data/window_buffer.hpp - Sliding window generation over pose frames
// ============================================================================
#pragma once
#include <vector>
#include <deque>
#include "../ortho_types.hpp"
#include "../ortho_config.hpp"
#include "../utils/log.hpp"

namespace ortho {

inline bool compute_window_visible(const std::vector<Frame>& frames, const WindowConfig& config) {
    if (frames.empty()) return false;

    size_t visible = 0;
    for (const auto& frame : frames) {
        if (is_frame_visible(frame, config.min_joint_visibility)) {
            visible++;
        }
    }
    return static_cast<float>(visible) >= config.window_visible_ratio * frames.size();
}

inline Window make_window(std::vector<Frame> frames, const WindowConfig& config) {
    Window window;
    window.window_visible = compute_window_visible(frames, config);
    window.frames = std::move(frames);
    return window;
}

// ============================================================================
// Streaming buffer: keeps the most recent window_size frames
// ============================================================================
class WindowBuffer {
private:
    WindowConfig config;
    std::deque<Frame> buffer;
    size_t rejected = 0;

public:
    WindowBuffer(const WindowConfig& cfg) : config(cfg) {}

    // Returns false (frame dropped) on wrong joint arity
    bool push(const Frame& frame) {
        if (!has_valid_shape(frame)) {
            rejected++;
            log::warn("WindowBuffer", "rejected frame with " +
                      std::to_string(frame.size()) + " joints");
            return false;
        }

        buffer.push_back(frame);
        if (buffer.size() > config.window_size) {
            buffer.pop_front();
        }
        return true;
    }

    bool ready() const {
        return buffer.size() >= config.min_frames_ready;
    }

    bool full() const {
        return buffer.size() == config.window_size;
    }

    Window snapshot() const {
        return make_window(std::vector<Frame>(buffer.begin(), buffer.end()), config);
    }

    void clear() {
        buffer.clear();
    }

    size_t size() const { return buffer.size(); }
    size_t capacity() const { return config.window_size; }
    size_t rejected_count() const { return rejected; }
};

// ============================================================================
// Batch windowing over a whole recording
// ============================================================================
// Shorter than window_size: one window holding every frame.
// Otherwise windows start at 0, step, 2*step, ... while start < total - window_size,
// so the final full-length start position is only used when it is offset 0.
inline std::vector<Window> make_batch_windows(const std::vector<Frame>& frames,
                                              const WindowConfig& config) {
    std::vector<Window> windows;
    const size_t total = frames.size();
    const size_t W = config.window_size > 0 ? config.window_size : 1;
    const size_t S = config.step > 0 ? config.step : 1;

    if (total == 0) {
        return windows;
    }

    if (total < W) {
        windows.push_back(make_window(frames, config));
        return windows;
    }

    for (size_t start = 0; start == 0 || start < total - W; start += S) {
        std::vector<Frame> chunk(frames.begin() + start, frames.begin() + start + W);
        windows.push_back(make_window(std::move(chunk), config));
    }

    return windows;
}

} // namespace ortho
