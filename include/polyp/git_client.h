#ifndef POLYP_GIT_CLIENT_H
#define POLYP_GIT_CLIENT_H

#include "polyp/config.h"

#include <optional>
#include <string>
#include <vector>

struct CommitSummary {
    std::string sha;
    std::string message;
};

enum class RebaseStatus {
    Completed,
    Conflict
};

struct RebaseResult {
    RebaseStatus status = RebaseStatus::Completed;
    std::string output;
};

// Version-control capability surface used by the stack, reconcile and
// orchestration code. Every operation either returns its result or throws
// GitCommandError; the boolean probes never throw for a plain "no".
class GitProvider {
public:
    virtual ~GitProvider() = default;

    virtual bool in_repository() = 0;
    virtual std::string git_dir() = 0;
    virtual std::string current_branch() = 0;

    virtual std::string merge_base(const std::string& base_ref, const std::string& target_ref) = 0;
    // Oldest first, ancestor excluded.
    virtual std::vector<std::string> rev_list(const std::string& ancestor, const std::string& ref) = 0;
    virtual std::vector<std::string> branches_at(const std::string& commit) = 0;
    virtual std::string commit_message(const std::string& commit) = 0;

    virtual RebaseResult rebase_onto(const std::string& new_base, const std::string& old_base,
                                     const std::string& target) = 0;
    virtual void abort_rebase() = 0;
    virtual bool rebase_in_progress() = 0;

    virtual void checkout(const std::string& ref) = 0;
    virtual void force_move_ref(const std::string& branch, const std::string& commit) = 0;
    // Newest first. HEAD when ref is empty.
    virtual std::vector<CommitSummary> recent_commits(const std::optional<std::string>& ref, size_t count) = 0;
    virtual bool ref_exists(const std::string& ref) = 0;

    virtual void push_force_with_lease(const std::string& branch, const std::string& remote = "origin") = 0;
};

class GitCliProvider : public GitProvider {
public:
    explicit GitCliProvider(PolypConfig config, std::string working_dir = "");

    bool in_repository() override;
    std::string git_dir() override;
    std::string current_branch() override;

    std::string merge_base(const std::string& base_ref, const std::string& target_ref) override;
    std::vector<std::string> rev_list(const std::string& ancestor, const std::string& ref) override;
    std::vector<std::string> branches_at(const std::string& commit) override;
    std::string commit_message(const std::string& commit) override;

    RebaseResult rebase_onto(const std::string& new_base, const std::string& old_base,
                             const std::string& target) override;
    void abort_rebase() override;
    bool rebase_in_progress() override;

    void checkout(const std::string& ref) override;
    void force_move_ref(const std::string& branch, const std::string& commit) override;
    std::vector<CommitSummary> recent_commits(const std::optional<std::string>& ref, size_t count) override;
    bool ref_exists(const std::string& ref) override;

    void push_force_with_lease(const std::string& branch, const std::string& remote = "origin") override;

private:
    struct GitOutput {
        int exit_code;
        std::string out;
        std::string err;
    };

    GitOutput run(const std::vector<std::string>& args);
    // Like run() but throws GitCommandError on a non-zero exit.
    std::string run_checked(const std::vector<std::string>& args);

    PolypConfig config_;
    std::string working_dir_;
};

#endif
