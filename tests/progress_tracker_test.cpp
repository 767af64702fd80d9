#include <gtest/gtest.h>
#include "core/progress_tracker.hpp"
#include "logging/logger.hpp"
#include <vector>

namespace
{
    class RecordingObserver : public ProgressObserver
    {
    public:
        void onProgress(const ProgressUpdate &update) override
        {
            updates.push_back(update);
        }

        std::vector<ProgressUpdate> updates;
    };
}

class ProgressTrackerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
        tracker_.subscribe(&observer_);
        tracker_.begin("task-1");
    }

    ProgressTracker tracker_;
    RecordingObserver observer_;
};

TEST_F(ProgressTrackerTest, HappyPathVisitsEveryStageInOrder)
{
    EXPECT_TRUE(tracker_.transition(Stage::Analyzing));
    EXPECT_TRUE(tracker_.transition(Stage::Converting));
    EXPECT_TRUE(tracker_.transition(Stage::Optimizing));
    EXPECT_TRUE(tracker_.transition(Stage::Finalizing));
    EXPECT_TRUE(tracker_.transition(Stage::Completed));

    EXPECT_EQ(tracker_.stage(), Stage::Completed);
    EXPECT_DOUBLE_EQ(tracker_.progress(), 1.0);

    std::vector<Stage> stages;
    for (const auto &update : observer_.updates)
    {
        EXPECT_EQ(update.task_id, "task-1");
        if (stages.empty() || stages.back() != update.stage)
        {
            stages.push_back(update.stage);
        }
    }
    std::vector<Stage> expected = {Stage::Idle, Stage::Analyzing, Stage::Converting, Stage::Optimizing,
                                   Stage::Finalizing, Stage::Completed};
    EXPECT_EQ(stages, expected);
}

TEST_F(ProgressTrackerTest, BackwardTransitionsAreRejected)
{
    tracker_.transition(Stage::Converting);
    EXPECT_FALSE(tracker_.transition(Stage::Analyzing));
    EXPECT_FALSE(tracker_.transition(Stage::Converting));
    EXPECT_EQ(tracker_.stage(), Stage::Converting);
}

TEST_F(ProgressTrackerTest, FailureIsReachableFromAnyNonTerminalStage)
{
    tracker_.transition(Stage::Optimizing);
    tracker_.fail("disk full");
    EXPECT_EQ(tracker_.stage(), Stage::Failed);
    EXPECT_EQ(observer_.updates.back().message, "disk full");

    EXPECT_FALSE(tracker_.transition(Stage::Completed));
    EXPECT_EQ(tracker_.stage(), Stage::Failed);
}

TEST_F(ProgressTrackerTest, ProgressNeverDecreasesAndIsClamped)
{
    tracker_.transition(Stage::Converting);
    tracker_.report(0.4);
    tracker_.report(0.2);
    EXPECT_DOUBLE_EQ(tracker_.progress(), 0.4);

    tracker_.report(7.0);
    EXPECT_DOUBLE_EQ(tracker_.progress(), 1.0);

    double previous = 0.0;
    for (const auto &update : observer_.updates)
    {
        EXPECT_GE(update.progress, previous);
        EXPECT_LE(update.progress, 1.0);
        previous = update.progress;
    }
}

TEST_F(ProgressTrackerTest, BeginResetsForTheNextTask)
{
    tracker_.transition(Stage::Completed);
    tracker_.begin("task-2");
    EXPECT_EQ(tracker_.stage(), Stage::Idle);
    EXPECT_DOUBLE_EQ(tracker_.progress(), 0.0);
    EXPECT_EQ(tracker_.taskId(), "task-2");
    EXPECT_TRUE(tracker_.transition(Stage::Analyzing));
}

TEST_F(ProgressTrackerTest, UnsubscribedObserversStopReceivingUpdates)
{
    size_t before = observer_.updates.size();
    tracker_.unsubscribe(&observer_);
    tracker_.transition(Stage::Analyzing);
    EXPECT_EQ(observer_.updates.size(), before);
}
