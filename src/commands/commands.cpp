#include "polyp/commands.h"
#include "polyp/errors.h"
#include "polyp/git_client.h"
#include "polyp/rebase_stack.h"
#include "polyp/state.h"
#include "polyp/ui.h"
#include "polyp/utils.h"

#include <iostream>
#include <optional>

const char* POLYP_VERSION = "0.1.0";

void print_usage() {
    std::cout << format_header("git-polyp") << " - Git automation toolkit" << std::endl;
    std::cout << std::endl;
    std::cout << format_header("USAGE:") << std::endl;
    std::cout << "  git-polyp <command> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << format_header("COMMANDS:") << std::endl;
    std::cout << "  rebase-stack      Rebase a linear stack of branches onto a new base" << std::endl;
    std::cout << std::endl;
    std::cout << format_header("GLOBAL OPTIONS:") << std::endl;
    std::cout << "  -h, --help        Show this help message" << std::endl;
    std::cout << "  -v, --version     Show version information" << std::endl;
    std::cout << std::endl;
    std::cout << "For more information on a specific command:" << std::endl;
    std::cout << "  git-polyp <command> --help" << std::endl;
}

void print_rebase_stack_usage() {
    std::cout << format_header("git-polyp rebase-stack") << " - Rebase a linear stack of branches" << std::endl;
    std::cout << std::endl;
    std::cout << format_header("USAGE:") << std::endl;
    std::cout << "  git-polyp rebase-stack <base-branch> <target-branch> [-y|--yes]" << std::endl;
    std::cout << "  git-polyp rebase-stack --continue" << std::endl;
    std::cout << "  git-polyp rebase-stack --abort" << std::endl;
    std::cout << "  git-polyp rebase-stack --status" << std::endl;
    std::cout << std::endl;
    std::cout << format_header("ARGUMENTS:") << std::endl;
    std::cout << "  <base-branch>     The branch to rebase onto (e.g., main)" << std::endl;
    std::cout << "  <target-branch>   The top branch of the stack to rebase" << std::endl;
    std::cout << std::endl;
    std::cout << format_header("OPTIONS:") << std::endl;
    std::cout << "  --continue        Continue rebase after resolving conflicts" << std::endl;
    std::cout << "  --abort           Abort the rebase operation" << std::endl;
    std::cout << "  --status          Show the operation in progress, if any" << std::endl;
    std::cout << "  -y, --yes         Do not ask for confirmation before rebasing" << std::endl;
    std::cout << "  -h, --help        Show this help message" << std::endl;
}

namespace {

void print_conflict_instructions() {
    std::cout << std::endl;
    std::cout << format_warning("Rebase conflict detected!") << std::endl;
    std::cout << std::endl;
    std::cout << "Please resolve the conflicts and then run:" << std::endl;
    std::cout << format_command("git-polyp rebase-stack --continue") << std::endl;
    std::cout << std::endl;
    std::cout << "Or abort the rebase:" << std::endl;
    std::cout << format_command("git-polyp rebase-stack --abort") << std::endl;
    std::cout << std::endl;
}

void push_branches(GitProvider& git, const std::vector<BranchUpdate>& updates) {
    std::cout << std::endl << format_info("Pushing branches...") << std::endl << std::endl;

    std::vector<std::string> failed;
    for (const BranchUpdate& update : updates) {
        std::cout << "Pushing " << format_branch(update.branch) << "..." << std::endl;
        try {
            git.push_force_with_lease(update.branch);
            std::cout << format_success("  " + update.branch + " pushed successfully") << std::endl;
        } catch (const GitCommandError& e) {
            std::cout << format_error("  Failed to push " + update.branch + ": " + e.output()) << std::endl;
            failed.push_back(update.branch);
        }
    }
    std::cout << std::endl;

    if (failed.empty()) {
        std::cout << format_success("All branches pushed successfully!") << std::endl;
        return;
    }
    std::cout << format_warning("Some branches failed to push:") << std::endl;
    for (const std::string& branch : failed) {
        std::cout << "  - " << branch << std::endl;
    }
    std::cout << std::endl << "You can retry pushing these branches manually." << std::endl;
}

void print_push_instructions(GitProvider& git, const std::vector<BranchUpdate>& updates) {
    if (updates.empty()) return;

    std::cout << format_header("Next steps:") << std::endl;
    std::cout << "To push the rebased branches to remote, run:" << std::endl << std::endl;
    for (const BranchUpdate& update : updates) {
        std::cout << format_command("git push --force-with-lease origin " + update.branch) << std::endl;
    }
    std::cout << std::endl;

    if (!stdin_is_terminal()) return;
    if (confirm("Would you like to push all these branches now?", std::cin, std::cout)) {
        push_branches(git, updates);
    } else {
        std::cout << "You can push the branches manually later using the commands above." << std::endl;
    }
}

int report_reconcile(GitProvider& git, const ReconcileResult& result) {
    std::cout << format_success("Rebase completed successfully!") << std::endl << std::endl;

    if (result.status == ReconcileStatus::Failed) {
        if (!result.updates.empty()) {
            std::cout << format_header("Updated branches:") << std::endl;
            std::cout << format_updates(result.updates) << std::endl << std::endl;
        }
        std::cerr << format_error("Failed to update some branches:") << std::endl << std::endl;
        for (const UpdateFailure& failure : result.failures) {
            std::cerr << "  " << describe_update_failure(failure) << std::endl;
        }
        std::cerr << std::endl;
        std::cerr << format_error("Branch update failed") << std::endl;
        return 1;
    }

    std::cout << format_header("Updated branches:") << std::endl;
    std::cout << format_updates(result.updates) << std::endl << std::endl;

    if (result.status == ReconcileStatus::Warning) {
        std::cout << format_warning("Some commits could not be matched:") << std::endl;
        for (const UnmatchedEntry& entry : result.unmatched) {
            std::cout << "  " << entry.branch << " (" << short_sha(entry.old_commit) << ")" << std::endl;
        }
        std::cout << std::endl;
    }

    print_push_instructions(git, result.updates);
    return 0;
}

int run_start(GitProvider& git, const StateStore& store, const std::string& base, const std::string& target,
              bool assume_yes, const RebaseStackOptions& base_options) {
    RebaseStackOptions options = base_options;
    options.confirm = [assume_yes](const Stack& stack, const std::string& base_branch,
                                   const std::string& target_branch) {
        std::cout << format_header("Stack to rebase:") << std::endl << std::endl;
        std::cout << "  Base:   " << format_branch(base_branch) << std::endl;
        std::cout << "  Target: " << format_branch(target_branch) << std::endl << std::endl;
        std::cout << format_stack(stack) << std::endl << std::endl;
        if (assume_yes) return true;
        return confirm("Proceed with rebase?", std::cin, std::cout);
    };

    StartResult result = start_rebase_stack(git, store, base, target, options);
    if (result.status == StartStatus::Conflict) {
        print_conflict_instructions();
        return 0;
    }
    return report_reconcile(git, result.reconcile);
}

int run_continue(GitProvider& git, const StateStore& store, const RebaseStackOptions& options) {
    ContinueResult result = continue_rebase_stack(git, store, options);
    return report_reconcile(git, result.reconcile);
}

int run_abort(GitProvider& git, const StateStore& store, const RebaseStackOptions& options) {
    AbortResult result = abort_rebase_stack(git, store, options);
    std::cout << format_success("Rebase-stack operation aborted") << std::endl;
    if (!result.git_abort_failed) {
        std::cout << "Repository has been restored to its previous state." << std::endl;
    }
    if (result.metadata && !result.metadata->original_branch.empty()) {
        std::cout << "You were on " << format_branch(result.metadata->original_branch)
                  << " before the rebase-stack started." << std::endl;
    }
    return 0;
}

int run_status(const StateStore& store) {
    std::optional<OperationMetadata> metadata = load_operation(store);
    if (!metadata) {
        std::cout << "No rebase-stack operation in progress." << std::endl;
        return 0;
    }
    std::cout << format_header("Rebase-stack operation in progress") << std::endl << std::endl;
    std::cout << "  Base:            " << format_branch(metadata->base_branch) << std::endl;
    std::cout << "  Target:          " << format_branch(metadata->target_branch) << std::endl;
    std::cout << "  Original branch: "
              << (metadata->original_branch.empty() ? "(detached HEAD)" : metadata->original_branch) << std::endl;
    std::cout << "  Merge base:      " << format_commit(metadata->merge_base) << std::endl;
    if (!metadata->timestamp.empty()) {
        std::cout << "  Started:         " << metadata->timestamp << std::endl;
    }
    std::cout << std::endl << format_stack(metadata->stack) << std::endl;
    return 0;
}

}

int handle_rebase_stack(const std::vector<std::string>& args, const PolypConfig& config) {
    bool do_continue = false;
    bool do_abort = false;
    bool do_status = false;
    bool assume_yes = config.assume_yes;
    std::vector<std::string> positional;

    for (const std::string& arg : args) {
        if (arg == "-h" || arg == "--help") {
            print_rebase_stack_usage();
            return 0;
        } else if (arg == "--continue") {
            do_continue = true;
        } else if (arg == "--abort") {
            do_abort = true;
        } else if (arg == "--status") {
            do_status = true;
        } else if (arg == "-y" || arg == "--yes") {
            assume_yes = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << format_error("Unknown option: " + arg) << std::endl;
            std::cerr << "Run 'git-polyp rebase-stack --help' for usage information." << std::endl;
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    int modes = (do_continue ? 1 : 0) + (do_abort ? 1 : 0) + (do_status ? 1 : 0) + (positional.empty() ? 0 : 1);
    if (modes != 1 || (!positional.empty() && positional.size() != 2)) {
        print_rebase_stack_usage();
        std::cerr << format_error("Invalid arguments. Expected: base-branch target-branch") << std::endl;
        return 1;
    }

    GitCliProvider git(config);
    RebaseStackOptions options;
    options.progress = [](const std::string& message) {
        std::cout << format_info(message) << std::endl;
    };

    try {
        if (!git.in_repository()) {
            std::cerr << format_error("Not in a git repository") << std::endl;
            return 1;
        }
        StateStore store(git.git_dir());

        if (do_continue) return run_continue(git, store, options);
        if (do_abort) return run_abort(git, store, options);
        if (do_status) return run_status(store);
        return run_start(git, store, positional[0], positional[1], assume_yes, options);
    } catch (const PolypError& e) {
        std::cerr << format_error(e.what()) << std::endl;
        return 1;
    } catch (const GitCommandError& e) {
        std::cerr << format_error(e.what()) << std::endl;
        return 1;
    }
}
