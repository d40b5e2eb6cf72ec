#include "polyp/rebase_stack.h"
#include "polyp/errors.h"

#include <iostream>

namespace {

void report(const RebaseStackOptions& options, const std::string& message) {
    if (options.progress) options.progress(message);
}

void require_repository(GitProvider& git) {
    if (!git.in_repository()) {
        throw PolypError(ErrorKind::NotARepository, "Not in a git repository");
    }
}

void clear_state(const StateStore& store) {
    try {
        store.remove();
    } catch (const std::runtime_error& e) {
        throw PolypError(ErrorKind::Plumbing, e.what());
    }
}

// Rewritten commits are read from `ref` before the base is checked out, so that
// no stack branch is checked out while it is force-moved.
ReconcileResult finalize(GitProvider& git, const StateStore& store, const OperationMetadata& metadata,
                         const std::optional<std::string>& ref, const RebaseStackOptions& options) {
    std::vector<CommitSummary> rewritten;
    try {
        rewritten = git.recent_commits(ref, metadata.stack.size());
    } catch (const GitCommandError& e) {
        std::string from = ref ? *ref : std::string("HEAD");
        throw PolypError(ErrorKind::Plumbing, "Failed to get new commits from " + from + ": " + e.what());
    }

    report(options, "Switching to " + metadata.base_branch + " to update branch pointers...");
    try {
        git.checkout(metadata.base_branch);
    } catch (const GitCommandError& e) {
        std::cerr << "Warning: Could not checkout " << metadata.base_branch << ": " << e.output() << std::endl;
        std::cerr << "Attempting to update branches anyway..." << std::endl;
    }

    ReconcileResult result = reconcile_branches(git, metadata.stack, rewritten);
    // A rejected move would be rejected again on retry, so the record goes in every outcome.
    clear_state(store);
    return result;
}

}

std::optional<OperationMetadata> load_operation(const StateStore& store) {
    try {
        return store.load();
    } catch (const MetadataError& e) {
        throw PolypError(ErrorKind::CorruptState, std::string("Failed to load rebase metadata: ") + e.what());
    } catch (const std::runtime_error& e) {
        throw PolypError(ErrorKind::CorruptState, std::string("Failed to read metadata file: ") + e.what());
    }
}

StartResult start_rebase_stack(GitProvider& git, const StateStore& store, const std::string& base_branch,
                               const std::string& target_branch, const RebaseStackOptions& options) {
    require_repository(git);

    if (store.exists()) {
        throw PolypError(ErrorKind::OperationInProgress,
                         "A rebase-stack operation is already in progress.\n"
                         "Use --continue to resume or --abort to cancel.");
    }
    if (git.rebase_in_progress()) {
        throw PolypError(ErrorKind::ExternalRebaseInProgress,
                         "A git rebase is in progress.\n"
                         "Please finish it with 'git rebase --continue' or 'git rebase --abort' first.");
    }

    std::string original_branch;
    try {
        original_branch = git.current_branch();
    } catch (const GitCommandError& e) {
        throw PolypError(ErrorKind::Plumbing, std::string("Failed to read the current branch: ") + e.what());
    }

    if (!git.ref_exists(base_branch)) {
        throw PolypError(ErrorKind::RefNotFound, "Base branch '" + base_branch + "' does not exist");
    }
    if (!git.ref_exists(target_branch)) {
        throw PolypError(ErrorKind::RefNotFound, "Target branch '" + target_branch + "' does not exist");
    }

    StackBuild build = build_stack(git, base_branch, target_branch);
    validate_linear_stack(build.stack);

    if (options.confirm && !options.confirm(build.stack, base_branch, target_branch)) {
        throw PolypError(ErrorKind::Cancelled, "Rebase cancelled by user");
    }

    StartResult result;
    result.metadata = make_metadata(base_branch, build.merge_base, target_branch, build.stack, original_branch);
    try {
        store.save(result.metadata);
    } catch (const std::runtime_error& e) {
        throw PolypError(ErrorKind::Plumbing, std::string("Failed to save metadata: ") + e.what());
    }

    try {
        git.checkout(target_branch);
    } catch (const GitCommandError& e) {
        // Nothing has been rewritten yet.
        clear_state(store);
        throw PolypError(ErrorKind::Plumbing, "Failed to checkout " + target_branch + ": " + e.output());
    }

    report(options, "Starting rebase...");
    RebaseResult rebase;
    try {
        rebase = git.rebase_onto(base_branch, build.merge_base, target_branch);
    } catch (const GitCommandError& e) {
        throw PolypError(ErrorKind::Plumbing, std::string("Failed to run rebase: ") + e.what());
    }

    if (rebase.status == RebaseStatus::Conflict) {
        result.status = StartStatus::Conflict;
        return result;
    }

    result.status = StartStatus::Completed;
    result.reconcile = finalize(git, store, result.metadata, std::nullopt, options);
    return result;
}

ContinueResult continue_rebase_stack(GitProvider& git, const StateStore& store,
                                     const RebaseStackOptions& options) {
    require_repository(git);

    std::optional<OperationMetadata> metadata = load_operation(store);
    if (!metadata) {
        throw PolypError(ErrorKind::NoOperation,
                         "No rebase-stack operation in progress.\n"
                         "Start a new one with: git-polyp rebase-stack <base> <target>");
    }
    if (git.rebase_in_progress()) {
        throw PolypError(ErrorKind::ConflictsPending,
                         "Git rebase still has conflicts.\n"
                         "Please resolve conflicts and stage changes with 'git add',\n"
                         "then run 'git rebase --continue' before running this command again.");
    }

    report(options, "Continuing rebase-stack operation...");
    ContinueResult result;
    result.metadata = *metadata;
    result.reconcile = finalize(git, store, result.metadata, result.metadata.target_branch, options);
    return result;
}

AbortResult abort_rebase_stack(GitProvider& git, const StateStore& store, const RebaseStackOptions& options) {
    require_repository(git);

    if (!store.exists()) {
        throw PolypError(ErrorKind::NoOperation,
                         "No rebase-stack operation in progress.\n"
                         "Start a new one with: git-polyp rebase-stack <base> <target>");
    }

    AbortResult result;
    try {
        result.metadata = load_operation(store);
    } catch (const PolypError& e) {
        // An unreadable record must still be removable.
        std::cerr << "Warning: " << e.what() << std::endl;
    }

    if (git.rebase_in_progress()) {
        report(options, "Aborting git rebase...");
        try {
            git.abort_rebase();
            result.git_rebase_aborted = true;
        } catch (const GitCommandError& e) {
            result.git_abort_failed = true;
            std::cerr << "Warning: Failed to abort git rebase: " << e.output() << std::endl;
            std::cerr << "You may need to manually run: git rebase --abort" << std::endl;
        }
    }

    clear_state(store);
    return result;
}
