#pragma once

namespace peerbench {

/// Version information
struct Version {
    static constexpr int MAJOR = PB_VERSION_MAJOR;
    static constexpr int MINOR = PB_VERSION_MINOR;
    static constexpr int PATCH = PB_VERSION_PATCH;

    static const char* get_version_string();
};

} // namespace peerbench
