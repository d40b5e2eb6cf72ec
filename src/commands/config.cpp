#include "polyp/config.h"

#include <cstdlib>
#include <string>

bool env_flag_enabled(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) return false;
    std::string flag = value;
    return !flag.empty() && flag != "0";
}

PolypConfig load_config_from_env() {
    PolypConfig config;

    const char* git = std::getenv("POLYP_GIT");
    if (git != nullptr && *git != '\0') {
        config.git_executable = git;
    }
    config.trace = env_flag_enabled("POLYP_TRACE");
    // NO_COLOR disables color whatever its value.
    config.color = std::getenv("NO_COLOR") == nullptr;
    config.assume_yes = env_flag_enabled("POLYP_ASSUME_YES");

    return config;
}
