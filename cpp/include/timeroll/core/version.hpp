#pragma once

/**
 * @file version.hpp
 * @brief Library version, set by the build (TR_VERSION_*)
 */

namespace timeroll {

/// Version information
struct Version {
    static constexpr int MAJOR = TR_VERSION_MAJOR;
    static constexpr int MINOR = TR_VERSION_MINOR;
    static constexpr int PATCH = TR_VERSION_PATCH;
    
    /// "MAJOR.MINOR.PATCH"
    static const char* get_version_string();
    
    /// Version plus optional components, e.g. "timeroll 0.1.0 (arrow)"
    static const char* get_build_string();
    
    static constexpr bool is_at_least(int major, int minor, int patch) {
        return MAJOR != major ? MAJOR > major
             : MINOR != minor ? MINOR > minor
             : PATCH >= patch;
    }
};

} // namespace timeroll
