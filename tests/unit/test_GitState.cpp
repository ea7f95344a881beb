#include <gtest/gtest.h>
#include "workspace/GitState.hpp"
#include "util/process.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace wsync::workspace;
using wsync::util::runProcessChecked;

TEST(GitStateParseTest, ParsesListHeadsOutput) {
    const auto heads = GitState::parseBundleHeads(
        "1111111111111111111111111111111111111111 refs/heads/main\n"
        "2222222222222222222222222222222222222222 refs/tags/v1.0\r\n"
        "\n"
        "garbage-line\n"
        "1111111111111111111111111111111111111111 HEAD\n");

    ASSERT_EQ(heads.size(), 3u);
    EXPECT_EQ(heads[0].ref, "refs/heads/main");
    EXPECT_EQ(heads[1].sha, "2222222222222222222222222222222222222222");
    EXPECT_EQ(heads[1].ref, "refs/tags/v1.0");
    EXPECT_EQ(heads[2].ref, "HEAD");
}

TEST(GitStateParseTest, HeadAttachesToMatchingBranch) {
    const std::vector<BundleRef> heads{
        {"aaa", "refs/heads/feature"},
        {"bbb", "refs/heads/main"},
        {"aaa", "HEAD"},
    };
    EXPECT_EQ(GitState::resolveHeadBranch(heads), "refs/heads/feature");
}

TEST(GitStateParseTest, PrefersMainWhenBranchesShareHeadCommit) {
    const std::vector<BundleRef> heads{
        {"aaa", "refs/heads/feature"},
        {"aaa", "refs/heads/main"},
        {"aaa", "HEAD"},
    };
    EXPECT_EQ(GitState::resolveHeadBranch(heads), "refs/heads/main");
}

TEST(GitStateParseTest, DetachedHeadHasNoBranch) {
    const std::vector<BundleRef> heads{{"aaa", "refs/heads/main"}, {"ccc", "HEAD"}};
    EXPECT_EQ(GitState::resolveHeadBranch(heads), std::nullopt);
}

TEST(GitStateParseTest, WithoutHeadFallsBackToMainThenFirstBranch) {
    EXPECT_EQ(GitState::resolveHeadBranch({{"a", "refs/heads/dev"}, {"b", "refs/heads/master"}}), "refs/heads/master");
    EXPECT_EQ(GitState::resolveHeadBranch({{"a", "refs/tags/v1"}, {"b", "refs/heads/dev"}}), "refs/heads/dev");
    EXPECT_EQ(GitState::resolveHeadBranch({{"a", "refs/tags/v1"}}), std::nullopt);
}

class GitStateRoundTripTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        if (!wsync::util::executableAvailable("git")) GTEST_SKIP() << "git not installed";
        root = fs::temp_directory_path() / ("wsync-git-test-" + std::to_string(::getpid()));
        fs::remove_all(root);
        fs::create_directories(root / "src");
        fs::create_directories(root / "dst");
    }

    void TearDown() override {
        if (!root.empty()) fs::remove_all(root);
    }

    static void write(const fs::path& p, const std::string& content) {
        fs::create_directories(p.parent_path());
        std::ofstream(p) << content;
    }

    static std::string git(const fs::path& repo, const std::vector<std::string>& args) {
        std::vector<std::string> argv{"git", "-c", "user.name=wsync", "-c", "user.email=wsync@example.invalid",
                                      "-c", "commit.gpgsign=false"};
        argv.insert(argv.end(), args.begin(), args.end());
        return runProcessChecked(argv, repo).output;
    }
};

TEST_F(GitStateRoundTripTest, BundleRestoresBranchesAndHead) {
    const auto src = root / "src";
    git(src, {"init", "--quiet"});
    git(src, {"checkout", "--quiet", "-b", "main"});
    write(src / "main.py", "print('hello')\n");
    git(src, {"add", "main.py"});
    git(src, {"commit", "--quiet", "-m", "first"});
    git(src, {"branch", "topic"});
    git(src, {"tag", "v1"});
    const auto headSha = git(src, {"rev-parse", "HEAD"});

    const auto bundle = root / "ws.bundle";
    GitState(src).createBundle(bundle);
    ASSERT_TRUE(fs::exists(bundle));

    // working tree files arrive separately, as after a workspace download
    const auto dst = root / "dst";
    write(dst / "main.py", "print('hello')\n");

    const GitState restored(dst);
    ASSERT_FALSE(restored.hasRepository());
    restored.restoreFromBundle(bundle);
    ASSERT_TRUE(restored.hasRepository());

    EXPECT_EQ(git(dst, {"rev-parse", "HEAD"}), headSha);
    EXPECT_EQ(git(dst, {"symbolic-ref", "HEAD"}), "refs/heads/main\n");
    EXPECT_EQ(git(dst, {"rev-parse", "topic"}), headSha);
    EXPECT_EQ(git(dst, {"rev-parse", "v1^{commit}"}), headSha);
    // index matches HEAD and the tree is clean
    EXPECT_EQ(git(dst, {"status", "--porcelain"}), "");
}

TEST_F(GitStateRoundTripTest, RestoreRefusesExistingRepository) {
    const auto dst = root / "dst";
    git(dst, {"init", "--quiet"});
    EXPECT_THROW(GitState(dst).restoreFromBundle(root / "missing.bundle"), std::runtime_error);
}

TEST_F(GitStateRoundTripTest, EmptyRepositoryCannotBeBundled) {
    const auto src = root / "src";
    git(src, {"init", "--quiet"});
    EXPECT_THROW(GitState(src).createBundle(root / "empty.bundle"), wsync::util::ProcessError);
}
