#pragma once

#include <string>
#include <nlohmann/json.hpp>

// QKDNET_VERSION and QKDNET_GIT_COMMIT come from the build; __DATE__/__TIME__
// stand in for a build timestamp.
namespace qkdnet::buildinfo {

inline std::string version() {
#ifdef QKDNET_VERSION
    return QKDNET_VERSION;
#else
    return "0.0.0";
#endif
}

inline std::string git_commit() {
#ifdef QKDNET_GIT_COMMIT
    return QKDNET_GIT_COMMIT;
#else
    return "unknown";
#endif
}

inline std::string build_time() {
    return std::string(__DATE__) + " " + __TIME__;
}

// "qkdnet_sim 0.1.0 (commit abc123, built Oct 19 2026 10:00:00)"
inline std::string version_line(const std::string& program) {
    return program + " " + version() + " (commit " + git_commit() + ", built " + build_time() + ")";
}

// Attached to batch results so a saved run names the binary that produced it.
inline nlohmann::json meta() {
    return {
        {"version", version()},
        {"git_commit", git_commit()},
        {"build_time", build_time()}
    };
}

} // namespace qkdnet::buildinfo
