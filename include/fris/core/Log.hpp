#pragma once
// =============================================================================
// Log.hpp - Tagged console logging
// =============================================================================
// Same convention as the rest of the tree: "[Component] message" lines,
// info to stdout, errors to stderr. Only one-time events log; the per-record
// scoring path stays silent.
// =============================================================================

#include <atomic>
#include <cstdio>

namespace fris {
namespace Log {

inline std::atomic<bool>& quietFlag() {
    static std::atomic<bool> quiet{false};
    return quiet;
}

inline void setQuiet(bool quiet) { quietFlag().store(quiet); }
inline bool quiet() { return quietFlag().load(); }

} // namespace Log
} // namespace fris

#define FRIS_LOG_INFO(tag, fmt, ...)                                       \
    do {                                                                   \
        if (!::fris::Log::quiet()) {                                       \
            std::printf("[" tag "] " fmt "\n", ##__VA_ARGS__);             \
        }                                                                  \
    } while (0)

#define FRIS_LOG_ERROR(tag, fmt, ...)                                      \
    std::fprintf(stderr, "[" tag "] ERROR: " fmt "\n", ##__VA_ARGS__)
