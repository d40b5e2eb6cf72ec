#ifndef POLYP_REBASE_STACK_H
#define POLYP_REBASE_STACK_H

#include "polyp/branch_updater.h"
#include "polyp/git_client.h"
#include "polyp/metadata.h"
#include "polyp/stack.h"
#include "polyp/state.h"

#include <functional>
#include <optional>
#include <string>

// Called with the computed stack before anything is written; false cancels.
using StackConfirmFn = std::function<bool(const Stack& stack, const std::string& base_branch,
                                          const std::string& target_branch)>;

struct RebaseStackOptions {
    StackConfirmFn confirm;
    // Progress messages ("Starting rebase...", ...). May be empty.
    std::function<void(const std::string&)> progress;
};

enum class StartStatus {
    Completed,
    Conflict
};

struct StartResult {
    StartStatus status = StartStatus::Completed;
    OperationMetadata metadata;
    ReconcileResult reconcile; // only meaningful when Completed
};

struct ContinueResult {
    OperationMetadata metadata;
    ReconcileResult reconcile;
};

struct AbortResult {
    std::optional<OperationMetadata> metadata; // empty when the stored record was unreadable
    bool git_rebase_aborted = false;
    bool git_abort_failed = false;
};

// All three throw PolypError for every precondition and plumbing failure.
// Reconciliation failures come back in the result; the record is cleared either way.
StartResult start_rebase_stack(GitProvider& git, const StateStore& store, const std::string& base_branch,
                               const std::string& target_branch, const RebaseStackOptions& options = {});
ContinueResult continue_rebase_stack(GitProvider& git, const StateStore& store,
                                     const RebaseStackOptions& options = {});
AbortResult abort_rebase_stack(GitProvider& git, const StateStore& store,
                               const RebaseStackOptions& options = {});

// std::nullopt when idle. Throws PolypError(CorruptState).
std::optional<OperationMetadata> load_operation(const StateStore& store);

#endif
