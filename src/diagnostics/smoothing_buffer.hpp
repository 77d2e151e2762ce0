// ============================================================================
// diagnostics/smoothing_buffer.hpp - Rolling mean over a scalar metric
// ============================================================================
#pragma once
#include <deque>
#include <numeric>

namespace ortho {

class SmoothingBuffer {
private:
    std::deque<float> values;
    size_t cap;

public:
    SmoothingBuffer(size_t capacity = 10) : cap(capacity > 0 ? capacity : 1) {}

    // Oldest value is evicted once the buffer is full
    void push(float value) {
        values.push_back(value);
        while (values.size() > cap) {
            values.pop_front();
        }
    }

    float mean() const {
        if (values.empty()) return 0.0f;
        return std::accumulate(values.begin(), values.end(), 0.0f) / values.size();
    }

    void clear() { values.clear(); }

    size_t size() const { return values.size(); }
    size_t capacity() const { return cap; }
    bool empty() const { return values.empty(); }
};

} // namespace ortho
