#include "timeroll/core/version.hpp"
#include "timeroll/statistics/arrow_utils.hpp"
#include <string>

namespace timeroll {

const char* Version::get_version_string() {
    static const std::string version =
        std::to_string(MAJOR) + "." + std::to_string(MINOR) + "." + std::to_string(PATCH);
    return version.c_str();
}

const char* Version::get_build_string() {
    static const std::string build = std::string("timeroll ") + get_version_string() +
        (arrow_utils::is_arrow_available() ? " (arrow)" : " (scalar)");
    return build.c_str();
}

} // namespace timeroll
