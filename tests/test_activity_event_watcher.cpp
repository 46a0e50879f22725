#include <gtest/gtest.h>
#include <terminal/text_grid.hpp>
#include <watchers/activity_event_watcher.hpp>
#include <watchers/ui_queue.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using Kind = ActivityEvent::Kind;

// ── Line classification ─────────────────────────────────────

TEST(ActivityEventWatcher, FileReads) {
    auto e = ActivityEventWatcher::parse_line("Reading file: src/main.cpp");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, Kind::FileRead);
    EXPECT_EQ(e->detail, "src/main.cpp");

    e = ActivityEventWatcher::parse_line("Opening file README.md");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, Kind::FileRead);
    EXPECT_EQ(e->detail, "README.md");

    e = ActivityEventWatcher::parse_line("Tool read: config.yaml");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, Kind::FileRead);
    EXPECT_EQ(e->detail, "config.yaml");
}

TEST(ActivityEventWatcher, CommandRuns) {
    auto e = ActivityEventWatcher::parse_line("Running: npm test");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, Kind::CommandRun);
    EXPECT_EQ(e->detail, "npm test");

    e = ActivityEventWatcher::parse_line("Executing cargo build --release");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, Kind::CommandRun);
    EXPECT_EQ(e->detail, "cargo build --release");

    e = ActivityEventWatcher::parse_line("$ ls -la");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, Kind::CommandRun);
    EXPECT_EQ(e->detail, "ls -la");

    e = ActivityEventWatcher::parse_line("> git status");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, Kind::CommandRun);
    EXPECT_EQ(e->detail, "git status");
}

TEST(ActivityEventWatcher, AgentStatusKeywords) {
    auto e = ActivityEventWatcher::parse_line("Thinking...");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, Kind::AgentStatus);
    EXPECT_EQ(e->detail, "Thinking...");
}

TEST(ActivityEventWatcher, AgentStatusGlyphs) {
    auto e = ActivityEventWatcher::parse_line("✓ Tests passed");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, Kind::AgentStatus);
    EXPECT_EQ(e->detail, "Tests passed");

    e = ActivityEventWatcher::parse_line("⠹ Loading index");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->detail, "Loading index");
}

TEST(ActivityEventWatcher, LongLinesAreNotStatus) {
    std::string line = "processing " + std::string(90, 'x');
    EXPECT_FALSE(ActivityEventWatcher::parse_line(line).has_value());
    EXPECT_TRUE(ActivityEventWatcher::parse_line(line, 200).has_value());
}

TEST(ActivityEventWatcher, OverlongLineIgnored) {
    std::string line = "$ " + std::string(100000, 'a');
    EXPECT_FALSE(ActivityEventWatcher::parse_line(line).has_value());
}

TEST(ActivityEventWatcher, PlainOutputIgnored) {
    EXPECT_FALSE(ActivityEventWatcher::parse_line("hello world").has_value());
    EXPECT_FALSE(ActivityEventWatcher::parse_line("✓").has_value());
}

TEST(ActivityEventWatcher, FileReadBeatsCommand) {
    auto e = ActivityEventWatcher::parse_line("Running: reading file: notes.txt");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, Kind::FileRead);
}

// ── Polling a grid ──────────────────────────────────────────

class ActivityEventWatcherTest : public ::testing::Test {
protected:
    UiQueue ui;
    std::shared_ptr<TextGrid> grid = std::make_shared<TextGrid>();
    std::vector<std::vector<ActivityEvent>> batches;
    ActivityEventWatcher watcher{ui, [this](const std::vector<ActivityEvent>& events) {
        batches.push_back(events);
    }};

    void SetUp() override {
        watcher.attach(grid);
    }
};

TEST_F(ActivityEventWatcherTest, OneBatchPerPollInRowOrder) {
    grid->append_line("Reading file: a.cpp");
    grid->append_line("plain text");
    grid->append_line("$ make");

    auto events = watcher.poll_once();
    ui.drain();

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], ActivityEvent::file_read("a.cpp"));
    EXPECT_EQ(events[1], ActivityEvent::command_run("make"));
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].size(), 2u);
}

TEST_F(ActivityEventWatcherTest, UnchangedRowsNotRepeated) {
    grid->append_line("Thinking...");
    watcher.poll_once();
    EXPECT_TRUE(watcher.poll_once().empty());
    ui.drain();
    EXPECT_EQ(batches.size(), 1u);

    grid->append_line("Running: cargo test");
    auto events = watcher.poll_once();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, Kind::CommandRun);
}

TEST_F(ActivityEventWatcherTest, EscapesStripped) {
    grid->append_line("\033[32m✓\033[0m Done");
    auto events = watcher.poll_once();

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], ActivityEvent::agent_status("Done"));
}

TEST_F(ActivityEventWatcherTest, ReattachRescansEverything) {
    grid->append_line("$ ls");
    EXPECT_EQ(watcher.poll_once().size(), 1u);

    watcher.attach(grid);
    EXPECT_EQ(watcher.poll_once().size(), 1u);
}

TEST_F(ActivityEventWatcherTest, NoDeliveryAfterStop) {
    grid->append_line("$ ls");
    watcher.poll_once();
    watcher.stop();
    ui.drain();

    EXPECT_TRUE(batches.empty());
}

TEST_F(ActivityEventWatcherTest, DetachedGridIsSilentTick) {
    watcher.detach();
    grid->append_line("$ ls");
    EXPECT_TRUE(watcher.poll_once().empty());
    EXPECT_EQ(ui.pending(), 0u);
}

TEST_F(ActivityEventWatcherTest, ConcurrentPollsDeliverInRowOrder) {
    constexpr int kCommands = 300;
    std::atomic<bool> writing{true};

    auto poll_until_done = [&] {
        while (writing.load()) watcher.poll_once();
    };
    std::thread timer_side(poll_until_done);
    std::thread repl_side(poll_until_done);

    for (int i = 0; i < kCommands; ++i) {
        grid->append_line("$ cmd" + std::to_string(i));
    }
    writing = false;
    timer_side.join();
    repl_side.join();
    watcher.poll_once();
    ui.drain();

    std::vector<std::string> delivered;
    for (const auto& batch : batches) {
        for (const auto& event : batch) delivered.push_back(event.detail);
    }
    ASSERT_EQ(delivered.size(), static_cast<size_t>(kCommands));
    for (int i = 0; i < kCommands; ++i) {
        EXPECT_EQ(delivered[i], "cmd" + std::to_string(i));
    }
}

// ── ActivityEvent ───────────────────────────────────────────

TEST(ActivityEvent, KindNamesAndLabel) {
    auto e = ActivityEvent::command_run("make test");
    EXPECT_STREQ(e.kind_name(), "run");
    EXPECT_EQ(e.label(), "make test");
    EXPECT_STREQ(ActivityEvent::file_read("a").kind_name(), "read");
    EXPECT_STREQ(ActivityEvent::agent_status("b").kind_name(), "status");
}
