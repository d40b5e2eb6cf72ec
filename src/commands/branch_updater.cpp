#include "polyp/branch_updater.h"
#include "polyp/errors.h"
#include "polyp/utils.h"

#include <cctype>
#include <sstream>
#include <unordered_map>

std::string normalize_message(const std::string& message) {
    std::string normalized;
    normalized.reserve(message.size());
    bool pending_space = false;
    for (char c : message) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = true;
            continue;
        }
        if (pending_space && !normalized.empty()) {
            normalized.push_back(' ');
        }
        pending_space = false;
        normalized.push_back(c);
    }
    return normalized;
}

ReconcileResult reconcile_branches(GitProvider& git, const Stack& stack,
                                   const std::vector<CommitSummary>& rewritten) {
    // Later duplicates overwrite earlier ones.
    std::unordered_map<std::string, std::string> new_commit_by_message;
    for (const CommitSummary& commit : rewritten) {
        new_commit_by_message[normalize_message(commit.message)] = commit.sha;
    }

    ReconcileResult result;
    for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
        const StackEntry& entry = *it;
        auto match = new_commit_by_message.find(normalize_message(entry.message));

        if (match == new_commit_by_message.end()) {
            for (const std::string& branch : entry.branches) {
                result.unmatched.push_back(UnmatchedEntry{branch, entry.commit, entry.message});
            }
            continue;
        }

        for (const std::string& branch : entry.branches) {
            try {
                git.force_move_ref(branch, match->second);
                result.updates.push_back(BranchUpdate{branch, entry.commit, match->second});
            } catch (const GitCommandError& e) {
                std::string reason = e.output().empty() ? e.what() : e.output();
                result.failures.push_back(UpdateFailure{branch, reason});
            }
        }
    }

    if (!result.failures.empty()) {
        result.status = ReconcileStatus::Failed;
    } else if (!result.unmatched.empty()) {
        result.status = ReconcileStatus::Warning;
    } else {
        result.status = ReconcileStatus::Success;
    }
    return result;
}

std::string format_updates(const std::vector<BranchUpdate>& updates) {
    std::ostringstream oss;
    for (size_t i = 0; i < updates.size(); ++i) {
        const BranchUpdate& update = updates[i];
        oss << "  " << update.branch << ": " << short_sha(update.old_commit) << " -> "
            << short_sha(update.new_commit);
        if (i + 1 < updates.size()) oss << "\n";
    }
    return oss.str();
}

std::string describe_update_failure(const UpdateFailure& failure) {
    if (failure.reason.find("worktree") != std::string::npos) {
        return failure.branch + ": Cannot update - branch is checked out in a worktree";
    }
    if (failure.reason.find("checked out") != std::string::npos) {
        return failure.branch + ": Cannot update - branch is currently checked out";
    }
    return failure.branch + ": " + failure.reason;
}
