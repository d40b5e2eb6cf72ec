#ifndef POLYP_CONFIG_H
#define POLYP_CONFIG_H

#include <string>

struct PolypConfig {
    std::string git_executable = "git";
    bool trace = false;
    bool color = true;
    bool assume_yes = false;
};

// Reads POLYP_GIT, POLYP_TRACE, NO_COLOR and POLYP_ASSUME_YES.
PolypConfig load_config_from_env();

bool env_flag_enabled(const char* name);

#endif
