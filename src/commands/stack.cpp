#include "polyp/stack.h"
#include "polyp/errors.h"
#include "polyp/ui.h"

#include <sstream>

StackBuild build_stack(GitProvider& git, const std::string& base_ref, const std::string& target_ref) {
    StackBuild build;
    try {
        build.merge_base = git.merge_base(base_ref, target_ref);
    } catch (const GitCommandError& e) {
        throw PolypError(ErrorKind::Plumbing, "Failed to find merge base of '" + base_ref + "' and '" +
                                                  target_ref + "': " + e.what());
    }

    std::vector<std::string> commits;
    try {
        commits = git.rev_list(build.merge_base, target_ref);
    } catch (const GitCommandError& e) {
        throw PolypError(ErrorKind::Plumbing, "Failed to list commits from " + build.merge_base + " to '" +
                                                  target_ref + "': " + e.what());
    }

    for (const std::string& commit : commits) {
        StackEntry entry;
        entry.commit = commit;
        try {
            entry.branches = git.branches_at(commit);
        } catch (const GitCommandError& e) {
            throw PolypError(ErrorKind::Plumbing, "Failed to list branches at " + commit + ": " + e.what());
        }
        try {
            entry.message = git.commit_message(commit);
        } catch (const GitCommandError& e) {
            throw PolypError(ErrorKind::Plumbing, "Failed to read message of " + commit + ": " + e.what());
        }
        build.stack.push_back(std::move(entry));
    }

    if (build.stack.empty()) {
        throw PolypError(ErrorKind::EmptyStack,
                         "No commits found between " + base_ref + " and " + target_ref);
    }
    return build;
}

void validate_linear_stack(const Stack& stack) {
    // rev-list over base..target already yields a single chain for linear history.
    (void)stack;
}

std::string format_stack(const Stack& stack) {
    std::ostringstream oss;
    for (size_t i = 0; i < stack.size(); ++i) {
        const StackEntry& entry = stack[i];
        std::string first_line = entry.message.substr(0, entry.message.find('\n'));

        oss << "* " << format_commit(entry.commit) << " - ";
        if (!entry.branches.empty()) {
            oss << "(";
            for (size_t b = 0; b < entry.branches.size(); ++b) {
                if (b > 0) oss << ", ";
                oss << format_branch(entry.branches[b]);
            }
            oss << ") ";
        }
        oss << first_line;
        if (i + 1 < stack.size()) oss << "\n";
    }
    return oss.str();
}
