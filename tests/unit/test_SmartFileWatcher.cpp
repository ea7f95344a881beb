#include <gtest/gtest.h>
#include "watcher/SmartFileWatcher.hpp"

#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using namespace wsync::watcher;
using wsync::config::WatcherConfig;

namespace {

WatcherConfig fastConfig() {
    WatcherConfig cfg;
    cfg.min_debounce = 60ms;
    cfg.max_debounce = 400ms;
    cfg.poll_interval = 20ms;
    cfg.burst_threshold = 10.0;
    return cfg;
}

// Collects callback batches and lets a test block until a condition holds.
struct Collector {
    std::mutex m;
    std::condition_variable cv;
    std::vector<std::set<std::string>> batches;

    SmartFileWatcher::ChangeCallback callback() {
        return [this](const std::set<std::string>& batch) {
            std::scoped_lock lock(m);
            batches.push_back(batch);
            cv.notify_all();
        };
    }

    std::set<std::string> all() {
        std::scoped_lock lock(m);
        std::set<std::string> out;
        for (const auto& b : batches) out.insert(b.begin(), b.end());
        return out;
    }

    // Waits for a batch at index >= `from` containing `path`.
    bool waitForPath(const std::string& path, const size_t from = 0, const std::chrono::milliseconds timeout = 3s) {
        std::unique_lock lock(m);
        return cv.wait_for(lock, timeout, [&] {
            for (size_t i = from; i < batches.size(); ++i)
                if (batches[i].contains(path)) return true;
            return false;
        });
    }

    size_t count() {
        std::scoped_lock lock(m);
        return batches.size();
    }
};

}

class SmartFileWatcherTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() / ("wsync-watcher-test-" + std::to_string(::getpid()) + "-" +
                                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root);
        fs::create_directories(root);
    }

    void TearDown() override { fs::remove_all(root); }

    void write(const std::string& rel, const std::string& content = "x") const {
        const auto p = root / rel;
        fs::create_directories(p.parent_path());
        std::ofstream(p) << content;
    }

    // Pushes the mtime forward so the change is visible regardless of timestamp granularity.
    void touchLater(const std::string& rel) const {
        const auto p = root / rel;
        fs::last_write_time(p, fs::last_write_time(p) + 2s);
    }
};

TEST_F(SmartFileWatcherTest, ScanClassifiesCreatedModifiedDeleted) {
    const IgnoreRules rules({}, false);
    FileState state;

    write("a.txt");
    write("dir/b.txt");
    auto r = SmartFileWatcher::scanDirectory(root, rules, state);
    EXPECT_EQ(r.created.size(), 2u);
    EXPECT_TRUE(r.modified.empty());
    EXPECT_TRUE(r.deleted.empty());
    EXPECT_EQ(state.size(), 2u);

    touchLater("a.txt");
    fs::remove(root / "dir/b.txt");
    write("c.txt");
    r = SmartFileWatcher::scanDirectory(root, rules, state);
    EXPECT_EQ(r.created, std::vector<std::string>{"c.txt"});
    EXPECT_EQ(r.modified, std::vector<std::string>{"a.txt"});
    EXPECT_EQ(r.deleted, std::vector<std::string>{"dir/b.txt"});
    EXPECT_EQ(state.size(), 2u);

    r = SmartFileWatcher::scanDirectory(root, rules, state);
    EXPECT_TRUE(r.empty());
}

TEST_F(SmartFileWatcherTest, ScanSkipsIgnoredTrees) {
    const IgnoreRules rules(WatcherConfig::defaultIgnorePatterns(), true);
    FileState state;

    write("main.py");
    write("node_modules/pkg/index.js");
    write("__pycache__/main.cpython-311.pyc");
    write(".git/HEAD");
    write("notes.swp");

    const auto r = SmartFileWatcher::scanDirectory(root, rules, state);
    EXPECT_EQ(r.created, std::vector<std::string>{"main.py"});
    EXPECT_EQ(state.size(), 1u);
}

TEST_F(SmartFileWatcherTest, MissingRootLeavesStateUntouched) {
    const IgnoreRules rules({}, false);
    FileState state;
    write("a.txt");
    (void)SmartFileWatcher::scanDirectory(root, rules, state);
    ASSERT_EQ(state.size(), 1u);

    fs::remove_all(root);
    const auto r = SmartFileWatcher::scanDirectory(root, rules, state);
    EXPECT_TRUE(r.root_missing);
    EXPECT_TRUE(r.deleted.empty());
    EXPECT_EQ(state.size(), 1u);
}

TEST(SmartFileWatcherDebounceTest, BurstGrowsUntilCapped) {
    WatcherConfig cfg;   // 2s..30s, threshold 10/s
    DebounceState st;
    st.current_debounce = cfg.min_debounce;
    auto t = std::chrono::steady_clock::now();

    SmartFileWatcher::updateDebounce(st, 20, t, cfg);
    EXPECT_EQ(st.current_debounce, 3000ms);

    for (int i = 0; i < 20; ++i) {
        t += 100ms;
        SmartFileWatcher::updateDebounce(st, 20, t, cfg);
    }
    EXPECT_EQ(st.current_debounce, cfg.max_debounce);
}

TEST(SmartFileWatcherDebounceTest, QuietPeriodsDecayToMinimum) {
    WatcherConfig cfg;
    DebounceState st;
    st.current_debounce = 10000ms;
    auto t = std::chrono::steady_clock::now();

    SmartFileWatcher::updateDebounce(st, 1, t, cfg);
    EXPECT_EQ(st.current_debounce, 9000ms);

    for (int i = 0; i < 50; ++i) {
        t += 5s;
        SmartFileWatcher::updateDebounce(st, 1, t, cfg);
    }
    EXPECT_EQ(st.current_debounce, cfg.min_debounce);
}

TEST(SmartFileWatcherDebounceTest, RateAccumulatesWithinOneSecondWindow) {
    WatcherConfig cfg;
    DebounceState st;
    st.current_debounce = cfg.min_debounce;
    const auto t = std::chrono::steady_clock::now();

    SmartFileWatcher::updateDebounce(st, 6, t, cfg);
    EXPECT_DOUBLE_EQ(st.changes_per_second, 6.0);
    EXPECT_EQ(st.current_debounce, cfg.min_debounce);

    SmartFileWatcher::updateDebounce(st, 6, t + 500ms, cfg);
    EXPECT_DOUBLE_EQ(st.changes_per_second, 12.0);
    EXPECT_EQ(st.current_debounce, 3000ms);

    SmartFileWatcher::updateDebounce(st, 2, t + 2500ms, cfg);
    EXPECT_DOUBLE_EQ(st.changes_per_second, 2.0);
    EXPECT_EQ(st.current_debounce, 2700ms);
}

TEST(SmartFileWatcherDebounceTest, StaysWithinBoundsForAnyChangePattern) {
    WatcherConfig cfg;
    cfg.min_debounce = 500ms;
    cfg.max_debounce = 7000ms;
    DebounceState st;
    st.current_debounce = cfg.min_debounce;

    std::mt19937 rng(42);
    std::uniform_int_distribution<int> changes(0, 60);
    std::uniform_int_distribution<int> gapMs(0, 3000);
    auto t = std::chrono::steady_clock::now();
    for (int i = 0; i < 2000; ++i) {
        t += std::chrono::milliseconds(gapMs(rng));
        SmartFileWatcher::updateDebounce(st, static_cast<size_t>(changes(rng)), t, cfg);
        ASSERT_GE(st.current_debounce, cfg.min_debounce);
        ASSERT_LE(st.current_debounce, cfg.max_debounce);
    }
}

TEST_F(SmartFileWatcherTest, BaselineFilesAreNotReported) {
    write("existing.txt");
    Collector c;
    SmartFileWatcher watcher(root, c.callback(), fastConfig());
    watcher.start();
    std::this_thread::sleep_for(300ms);
    watcher.stop();

    EXPECT_EQ(c.count(), 0u);
    EXPECT_EQ(watcher.status().tracked_files, 1u);
}

TEST_F(SmartFileWatcherTest, ChangesAreFlushedAfterDebounce) {
    write("keep.txt");
    Collector c;
    SmartFileWatcher watcher(root, c.callback(), fastConfig());
    watcher.start();

    write("src/new.py", "print(1)");
    EXPECT_TRUE(c.waitForPath("src/new.py"));

    touchLater("keep.txt");
    EXPECT_TRUE(c.waitForPath("keep.txt"));

    const auto seen = c.count();
    fs::remove(root / "src/new.py");
    EXPECT_TRUE(c.waitForPath("src/new.py", seen));
    watcher.stop();

    EXPECT_GE(c.count(), 2u);
    EXPECT_EQ(watcher.status().pending_changes, 0u);
}

TEST_F(SmartFileWatcherTest, DeletionIsReported) {
    write("gone.txt");
    Collector c;
    SmartFileWatcher watcher(root, c.callback(), fastConfig());
    watcher.start();

    fs::remove(root / "gone.txt");
    EXPECT_TRUE(c.waitForPath("gone.txt"));
    watcher.stop();
    EXPECT_EQ(watcher.status().tracked_files, 0u);
}

TEST_F(SmartFileWatcherTest, FailedCallbackRequeuesPaths) {
    std::mutex m;
    std::condition_variable cv;
    int calls = 0;
    std::set<std::string> secondBatch;

    SmartFileWatcher watcher(root, [&](const std::set<std::string>& batch) {
        std::scoped_lock lock(m);
        ++calls;
        if (calls == 1) throw std::runtime_error("storage offline");
        if (calls == 2) secondBatch = batch;
        cv.notify_all();
    }, fastConfig());
    watcher.start();

    write("retry.txt");
    {
        std::unique_lock lock(m);
        ASSERT_TRUE(cv.wait_for(lock, 3s, [&] { return calls >= 2; }));
    }
    watcher.stop();
    EXPECT_TRUE(secondBatch.contains("retry.txt"));
    EXPECT_FALSE(watcher.isRunning());
}

TEST_F(SmartFileWatcherTest, ImmediateSyncSkipsTheDebounce) {
    auto cfg = fastConfig();
    cfg.min_debounce = 60s;
    cfg.max_debounce = 120s;
    cfg.poll_interval = 30s;

    Collector c;
    SmartFileWatcher watcher(root, c.callback(), cfg);
    watcher.start();

    write("urgent.txt");
    watcher.triggerImmediateSync();

    EXPECT_EQ(c.count(), 1u);
    EXPECT_TRUE(c.all().contains("urgent.txt"));
    EXPECT_DOUBLE_EQ(watcher.status().current_debounce, 60.0);
    watcher.stop();
}

TEST_F(SmartFileWatcherTest, ImmediateSyncWithoutStartDoesNothing) {
    write("a.txt");
    Collector c;
    SmartFileWatcher watcher(root, c.callback(), fastConfig());
    watcher.triggerImmediateSync();
    EXPECT_EQ(c.count(), 0u);
}

TEST_F(SmartFileWatcherTest, ScanOnceQueuesPendingChanges) {
    Collector c;
    auto cfg = fastConfig();
    cfg.min_debounce = 60s;
    cfg.max_debounce = 60s;
    SmartFileWatcher watcher(root, c.callback(), cfg);

    write("one.txt");
    write("two.txt");
    EXPECT_EQ(watcher.scanOnce(), 2u);
    EXPECT_EQ(watcher.status().pending_changes, 2u);
    EXPECT_EQ(watcher.scanOnce(), 0u);
    EXPECT_EQ(c.count(), 0u);
}

TEST_F(SmartFileWatcherTest, StartAndStopAreIdempotent) {
    Collector c;
    SmartFileWatcher watcher(root, c.callback(), fastConfig());
    watcher.start();
    watcher.start();
    EXPECT_TRUE(watcher.status().running);
    watcher.stop();
    watcher.stop();
    EXPECT_FALSE(watcher.status().running);
}

TEST(SmartFileWatcherConfigTest, RejectsInvalidBounds) {
    auto cfg = fastConfig();
    cfg.max_debounce = 10ms;
    EXPECT_THROW(SmartFileWatcher("/tmp", [](const std::set<std::string>&) {}, cfg), std::invalid_argument);
    EXPECT_THROW(SmartFileWatcher("/tmp", nullptr, fastConfig()), std::invalid_argument);
}
