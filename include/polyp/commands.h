#ifndef POLYP_COMMANDS_H
#define POLYP_COMMANDS_H

#include "polyp/config.h"

#include <string>
#include <vector>

extern const char* POLYP_VERSION;

int handle_rebase_stack(const std::vector<std::string>& args, const PolypConfig& config);

void print_usage();
void print_rebase_stack_usage();

#endif
