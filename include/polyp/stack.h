#ifndef POLYP_STACK_H
#define POLYP_STACK_H

#include "polyp/git_client.h"

#include <string>
#include <vector>

struct StackEntry {
    std::string commit;
    std::vector<std::string> branches; // branches pointing exactly at commit, may be empty
    std::string message;

    bool operator==(const StackEntry& other) const {
        return commit == other.commit && branches == other.branches && message == other.message;
    }
};

// Oldest to newest, merge base excluded, target included.
using Stack = std::vector<StackEntry>;

struct StackBuild {
    Stack stack;
    std::string merge_base;
};

// Throws PolypError (Plumbing or EmptyStack). Never returns a partial or empty stack.
StackBuild build_stack(GitProvider& git, const std::string& base_ref, const std::string& target_ref);

// Always succeeds today. Reserved for rejecting non-linear history.
void validate_linear_stack(const Stack& stack);

// "* <short-commit> - (<branches>) <first message line>", one line per entry.
std::string format_stack(const Stack& stack);

#endif
