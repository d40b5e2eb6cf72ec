#include "polyp/errors.h"
#include "polyp/git_client.h"
#include "polyp/process.h"
#include "polyp/rebase_stack.h"
#include "polyp/utils.h"
#include "temp_dir.h"

#include <gtest/gtest.h>

#include <stdlib.h>

namespace {

bool git_available() {
    try {
        return run_process({"git", "--version"}).exit_code == 0;
    } catch (const std::runtime_error&) {
        return false;
    }
}

// A throwaway repository with a three-commit stack on top of main:
//   main: init
//   feature-1: "Add auth"      (auth.txt)
//   (no branch): "wip"         (notes.txt)
//   feature-2, hotfix: "Add settings" (settings.txt)
class GitRepoTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!git_available()) {
            // CI images are expected to ship git; only local runs may skip.
            if (getenv("CI") != nullptr) {
                FAIL() << "git executable not available but CI is set";
            }
            GTEST_SKIP() << "git executable not available";
        }
        setenv("GIT_EDITOR", "true", 1);
        setenv("GIT_CONFIG_NOSYSTEM", "1", 1);

        git({"init", "-q"});
        git({"symbolic-ref", "HEAD", "refs/heads/main"});
        git({"config", "user.name", "Polyp Test"});
        git({"config", "user.email", "polyp@example.com"});
        git({"config", "commit.gpgsign", "false"});

        commit_file("README", "hello\n", "Initial commit");
        git({"checkout", "-q", "-b", "feature-1"});
        commit_file("auth.txt", "auth\n", "Add auth\n\nWith a body line.");
        commit_file("notes.txt", "notes\n", "wip");
        git({"checkout", "-q", "-b", "feature-2"});
        commit_file("settings.txt", "settings\n", "Add settings");
        git({"branch", "hotfix"});
        git({"checkout", "-q", "feature-1"});
        git({"reset", "-q", "--hard", "HEAD~1"});
        git({"checkout", "-q", "main"});
    }

    std::string git(const std::vector<std::string>& args) {
        std::vector<std::string> argv = {"git"};
        argv.insert(argv.end(), args.begin(), args.end());
        ProcessResult result = run_process(argv, dir.path().string());
        if (result.exit_code != 0) {
            throw std::runtime_error("git failed: " + result.err);
        }
        return trim(result.out);
    }

    void commit_file(const std::string& name, const std::string& content, const std::string& message) {
        write_file((dir.path() / name).string(), content);
        git({"add", name});
        git({"commit", "-q", "-m", message});
    }

    std::string rev(const std::string& ref) { return git({"rev-parse", ref}); }

    TempDir dir;
    PolypConfig config;
};

}

TEST_F(GitRepoTest, ProviderReadsStackPlumbing) {
    GitCliProvider provider(config, dir.path().string());

    EXPECT_TRUE(provider.in_repository());
    EXPECT_EQ(provider.current_branch(), "main");
    EXPECT_TRUE(provider.ref_exists("feature-2"));
    EXPECT_FALSE(provider.ref_exists("does-not-exist"));
    EXPECT_FALSE(provider.rebase_in_progress());

    std::string base = provider.merge_base("main", "feature-2");
    EXPECT_EQ(base, rev("main"));
    std::vector<std::string> commits = provider.rev_list(base, "feature-2");
    ASSERT_EQ(commits.size(), 3u);
    EXPECT_EQ(commits[0], rev("feature-1"));
    EXPECT_EQ(provider.commit_message(commits[0]), "Add auth\n\nWith a body line.");
    EXPECT_EQ(provider.branches_at(commits[2]), (std::vector<std::string>{"feature-2", "hotfix"}));

    std::vector<CommitSummary> recent = provider.recent_commits(std::string("feature-2"), 2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].sha, rev("feature-2"));
    EXPECT_EQ(recent[0].message, "Add settings");
    EXPECT_EQ(recent[1].message, "wip");

    EXPECT_THROW(provider.merge_base("main", "does-not-exist"), GitCommandError);
}

TEST_F(GitRepoTest, StartRebasesWholeStackOntoNewBase) {
    commit_file("base.txt", "new base\n", "Move main forward");
    std::string new_base = rev("main");
    GitCliProvider provider(config, dir.path().string());
    StateStore store(provider.git_dir());

    StartResult result = start_rebase_stack(provider, store, "main", "feature-2");

    ASSERT_EQ(result.status, StartStatus::Completed);
    EXPECT_EQ(result.reconcile.status, ReconcileStatus::Success);
    EXPECT_EQ(result.reconcile.updates.size(), 3u);
    EXPECT_FALSE(store.exists());
    EXPECT_EQ(rev("feature-1~1"), new_base);
    EXPECT_EQ(rev("feature-2~2"), rev("feature-1"));
    EXPECT_EQ(rev("hotfix"), rev("feature-2"));
    EXPECT_EQ(provider.current_branch(), "main");
}

TEST_F(GitRepoTest, ConflictThenContinueUpdatesBranches) {
    commit_file("auth.txt", "conflicting\n", "Touch auth on main");
    GitCliProvider provider(config, dir.path().string());
    StateStore store(provider.git_dir());

    StartResult started = start_rebase_stack(provider, store, "main", "feature-2");
    ASSERT_EQ(started.status, StartStatus::Conflict);
    EXPECT_TRUE(store.exists());
    EXPECT_TRUE(provider.rebase_in_progress());

    try {
        continue_rebase_stack(provider, store);
        FAIL() << "expected ConflictsPending";
    } catch (const PolypError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConflictsPending);
    }

    write_file((dir.path() / "auth.txt").string(), "resolved\n");
    git({"add", "auth.txt"});
    git({"rebase", "--continue"});

    ContinueResult result = continue_rebase_stack(provider, store);

    EXPECT_EQ(result.reconcile.status, ReconcileStatus::Success);
    EXPECT_FALSE(store.exists());
    EXPECT_EQ(rev("feature-1~1"), rev("main"));
    EXPECT_EQ(rev("hotfix"), rev("feature-2"));
}

TEST_F(GitRepoTest, AbortRestoresRepository) {
    commit_file("auth.txt", "conflicting\n", "Touch auth on main");
    std::string feature_1 = rev("feature-1");
    std::string feature_2 = rev("feature-2");
    GitCliProvider provider(config, dir.path().string());
    StateStore store(provider.git_dir());

    ASSERT_EQ(start_rebase_stack(provider, store, "main", "feature-2").status, StartStatus::Conflict);

    AbortResult result = abort_rebase_stack(provider, store);

    EXPECT_TRUE(result.git_rebase_aborted);
    EXPECT_FALSE(store.exists());
    EXPECT_FALSE(provider.rebase_in_progress());
    EXPECT_EQ(rev("feature-1"), feature_1);
    EXPECT_EQ(rev("feature-2"), feature_2);
}

TEST_F(GitRepoTest, SameBaseAndTargetIsRejected) {
    GitCliProvider provider(config, dir.path().string());
    StateStore store(provider.git_dir());

    try {
        start_rebase_stack(provider, store, "main", "main");
        FAIL() << "expected EmptyStack";
    } catch (const PolypError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::EmptyStack);
    }
    EXPECT_FALSE(store.exists());
}

TEST_F(GitRepoTest, DetachedHeadIsNotTreatedAsBranch) {
    commit_file("base.txt", "new base\n", "Move main forward");
    std::string new_base = rev("main");
    git({"checkout", "-q", "--detach", "feature-1"});
    GitCliProvider provider(config, dir.path().string());
    StateStore store(provider.git_dir());

    EXPECT_EQ(provider.branches_at(rev("feature-1")), (std::vector<std::string>{"feature-1"}));

    StartResult result = start_rebase_stack(provider, store, "main", "feature-2");

    ASSERT_EQ(result.status, StartStatus::Completed);
    EXPECT_EQ(result.metadata.original_branch, "");
    for (const StackEntry& entry : result.metadata.stack) {
        for (const std::string& branch : entry.branches) {
            EXPECT_NE(branch.front(), '(') << branch;
        }
    }
    EXPECT_EQ(result.reconcile.status, ReconcileStatus::Success);
    EXPECT_TRUE(result.reconcile.failures.empty());
    EXPECT_EQ(result.reconcile.updates.size(), 3u);
    EXPECT_FALSE(store.exists());
    EXPECT_EQ(rev("feature-1~1"), new_base);
    EXPECT_EQ(rev("hotfix"), rev("feature-2"));
}

TEST_F(GitRepoTest, RebaseProbeOutsideRepositoryIsFalse) {
    TempDir outside;
    setenv("GIT_CEILING_DIRECTORIES", outside.path().parent_path().string().c_str(), 1);
    GitCliProvider provider(config, outside.path().string());

    EXPECT_FALSE(provider.in_repository());
    EXPECT_NO_THROW(EXPECT_FALSE(provider.rebase_in_progress()));
    EXPECT_THROW(provider.git_dir(), GitCommandError);

    unsetenv("GIT_CEILING_DIRECTORIES");
}
