#include "polyp/git_client.h"
#include "polyp/errors.h"
#include "polyp/process.h"
#include "polyp/utils.h"

#include <iostream>
#include <stdexcept>

GitCliProvider::GitCliProvider(PolypConfig config, std::string working_dir)
    : config_(std::move(config)), working_dir_(std::move(working_dir)) {}

GitCliProvider::GitOutput GitCliProvider::run(const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(config_.git_executable);
    argv.insert(argv.end(), args.begin(), args.end());

    if (config_.trace) {
        std::cerr << "trace: git";
        for (const std::string& arg : args) std::cerr << " " << arg;
        std::cerr << std::endl;
    }

    try {
        ProcessResult result = run_process(argv, working_dir_);
        return GitOutput{result.exit_code, std::move(result.out), std::move(result.err)};
    } catch (const std::runtime_error& e) {
        throw GitCommandError(args, -1, e.what());
    }
}

std::string GitCliProvider::run_checked(const std::vector<std::string>& args) {
    GitOutput result = run(args);
    if (result.exit_code != 0) {
        std::string message = trim(result.err);
        if (message.empty()) message = trim(result.out);
        throw GitCommandError(args, result.exit_code, message);
    }
    return result.out;
}

bool GitCliProvider::in_repository() {
    return run({"rev-parse", "--git-dir"}).exit_code == 0;
}

std::string GitCliProvider::git_dir() {
    return trim(run_checked({"rev-parse", "--absolute-git-dir"}));
}

std::string GitCliProvider::current_branch() {
    return trim(run_checked({"branch", "--show-current"}));
}

std::string GitCliProvider::merge_base(const std::string& base_ref, const std::string& target_ref) {
    return trim(run_checked({"merge-base", base_ref, target_ref}));
}

std::vector<std::string> GitCliProvider::rev_list(const std::string& ancestor, const std::string& ref) {
    return split_lines(run_checked({"rev-list", "--reverse", ancestor + ".." + ref}));
}

std::vector<std::string> GitCliProvider::branches_at(const std::string& commit) {
    // Local heads only; "git branch" would also list a detached HEAD entry.
    return split_lines(run_checked({"for-each-ref", "--points-at", commit, "--format=%(refname:short)",
                                    "refs/heads/"}));
}

std::string GitCliProvider::commit_message(const std::string& commit) {
    return trim(run_checked({"log", "-1", "--format=%B", commit}));
}

RebaseResult GitCliProvider::rebase_onto(const std::string& new_base, const std::string& old_base,
                                         const std::string& target) {
    GitOutput result = run({"rebase", "--onto", new_base, old_base, target});
    RebaseResult rebase;
    rebase.status = result.exit_code == 0 ? RebaseStatus::Completed : RebaseStatus::Conflict;
    rebase.output = trim(result.out + result.err);
    return rebase;
}

void GitCliProvider::abort_rebase() {
    run_checked({"rebase", "--abort"});
}

bool GitCliProvider::rebase_in_progress() {
    GitOutput result = run({"rev-parse", "--absolute-git-dir"});
    if (result.exit_code != 0) return false;
    fs::path dir = trim(result.out);
    std::error_code ec;
    return fs::is_directory(dir / "rebase-merge", ec) || fs::is_directory(dir / "rebase-apply", ec);
}

void GitCliProvider::checkout(const std::string& ref) {
    run_checked({"checkout", ref});
}

void GitCliProvider::force_move_ref(const std::string& branch, const std::string& commit) {
    run_checked({"branch", "--force", branch, commit});
}

std::vector<CommitSummary> GitCliProvider::recent_commits(const std::optional<std::string>& ref, size_t count) {
    std::string start = ref && !ref->empty() ? *ref : "HEAD";
    // Each commit is "<sha>\0<full message>\0", followed by git's record newline.
    std::string output = run_checked({"log", "-n", std::to_string(count), "--format=%H%x00%B%x00", start});

    std::vector<CommitSummary> commits;
    size_t pos = 0;
    while (pos < output.size()) {
        size_t sha_end = output.find('\0', pos);
        if (sha_end == std::string::npos) break;
        size_t message_end = output.find('\0', sha_end + 1);
        if (message_end == std::string::npos) {
            throw GitCommandError({"log", start}, 0, "unexpected log output format");
        }
        CommitSummary commit;
        commit.sha = trim(output.substr(pos, sha_end - pos));
        commit.message = trim(output.substr(sha_end + 1, message_end - sha_end - 1));
        commits.push_back(std::move(commit));
        pos = message_end + 1;
    }
    return commits;
}

bool GitCliProvider::ref_exists(const std::string& ref) {
    return run({"rev-parse", "--verify", "--quiet", ref}).exit_code == 0;
}

void GitCliProvider::push_force_with_lease(const std::string& branch, const std::string& remote) {
    run_checked({"push", "--force-with-lease", remote, branch});
}
