// ============================================================================
// utils/log.hpp - Console logging shared by the pipeline components
// ============================================================================
#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace ortho {
namespace log {

// Serializes lines written from the feedback worker and the caller thread
inline std::mutex& console_mutex() {
    static std::mutex m;
    return m;
}

inline void info(const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(console_mutex());
    std::cout << "[" << component << "] " << message << "\n";
}

inline void warn(const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(console_mutex());
    std::cerr << "[" << component << "] Warning: " << message << "\n";
}

inline void error(const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(console_mutex());
    std::cerr << "[" << component << "] Error: " << message << "\n";
}

} // namespace log
} // namespace ortho
