#pragma once

#include <mutex>

namespace parkgen {

// Global mutex to keep stderr logs from parallel evaluations readable (one line at a time).
inline std::mutex& log_mutex() {
    static std::mutex mu;
    return mu;
}

}  // namespace parkgen
