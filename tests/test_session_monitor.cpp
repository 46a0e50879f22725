#include <gtest/gtest.h>
#include <managers/session_monitor.hpp>
#include <terminal/text_grid.hpp>
#include <watchers/ui_queue.hpp>
#include <memory>
#include <vector>

class SessionMonitorTest : public ::testing::Test {
protected:
    Config config;
    UiQueue ui;
    std::shared_ptr<TextGrid> grid = std::make_shared<TextGrid>(24);
    SessionMonitor monitor{config, ui};
    std::vector<WatcherState> states;
    std::vector<ActivityEvent> events;

    void SetUp() override {
        monitor.set_state_callback([this](const WatcherState& s) { states.push_back(s); });
        monitor.set_activity_callback([this](const ActivityEvent& e) { events.push_back(e); });
        monitor.attach(grid);
    }

    void write(int row, const std::string& text) {
        auto range = grid->set_line(row, text);
        monitor.range_changed(range.start, range.end);
        monitor.poll_now();
        ui.drain();
    }
};

TEST_F(SessionMonitorTest, FoldsWatcherSignals) {
    write(23, "[plan] >");
    write(22, "model: gpt-4.1");

    WatcherState s = monitor.state();
    EXPECT_EQ(s.mode, AgentMode::Plan);
    EXPECT_EQ(s.model, std::optional<std::string>("gpt-4.1"));
    EXPECT_FALSE(s.waiting_for_input);
}

TEST_F(SessionMonitorTest, WaitingForInput) {
    write(23, "Run this command? [y/n]");
    EXPECT_TRUE(monitor.state().waiting_for_input);
    ASSERT_FALSE(states.empty());
    EXPECT_TRUE(states.back().waiting_for_input);
}

TEST_F(SessionMonitorTest, PromptVisible) {
    write(23, ">");
    EXPECT_TRUE(monitor.state().prompt_visible);
}

TEST_F(SessionMonitorTest, ActivityFeedInOrder) {
    write(0, "Reading file: src/app.ts");
    write(1, "$ npm test");

    auto feed = monitor.activity_feed();
    ASSERT_EQ(feed.size(), 2u);
    EXPECT_EQ(feed[0], ActivityEvent::file_read("src/app.ts"));
    EXPECT_EQ(feed[1], ActivityEvent::command_run("npm test"));
    EXPECT_EQ(events.size(), 2u);

    monitor.clear_feed();
    EXPECT_TRUE(monitor.activity_feed().empty());
}

TEST_F(SessionMonitorTest, AttachResetsState) {
    write(23, "Continue? (y/n)");
    write(0, "$ ls");

    monitor.attach(std::make_shared<TextGrid>(24));
    EXPECT_FALSE(monitor.state().waiting_for_input);
    EXPECT_TRUE(monitor.activity_feed().empty());
}

TEST_F(SessionMonitorTest, NothingAfterDetach) {
    auto range = grid->set_line(23, "Continue? (y/n)");
    monitor.range_changed(range.start, range.end);
    monitor.detach();
    ui.drain();

    EXPECT_TRUE(states.empty());
    EXPECT_FALSE(monitor.state().waiting_for_input);
}
