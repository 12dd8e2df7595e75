// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace roundtable::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetDefaultSettingsPath();
};

} // namespace roundtable::infrastructure
