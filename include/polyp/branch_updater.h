#ifndef POLYP_BRANCH_UPDATER_H
#define POLYP_BRANCH_UPDATER_H

#include "polyp/git_client.h"
#include "polyp/stack.h"

#include <string>
#include <vector>

struct BranchUpdate {
    std::string branch;
    std::string old_commit;
    std::string new_commit;
};

struct UnmatchedEntry {
    std::string branch;
    std::string old_commit;
    std::string message;
};

struct UpdateFailure {
    std::string branch;
    std::string reason;
};

enum class ReconcileStatus {
    Success,
    Warning, // some branches had no rewritten commit with a matching message
    Failed   // at least one branch move was rejected
};

struct ReconcileResult {
    ReconcileStatus status = ReconcileStatus::Success;
    std::vector<BranchUpdate> updates;
    std::vector<UnmatchedEntry> unmatched;
    std::vector<UpdateFailure> failures;
};

// Trims and collapses every whitespace run to one space.
std::string normalize_message(const std::string& message);

// Matches each stack entry to a rewritten commit by normalized message and
// force-moves its branches there. Per-branch failures are collected, not thrown.
ReconcileResult reconcile_branches(GitProvider& git, const Stack& stack,
                                   const std::vector<CommitSummary>& rewritten);

std::string format_updates(const std::vector<BranchUpdate>& updates);
std::string describe_update_failure(const UpdateFailure& failure);

#endif
