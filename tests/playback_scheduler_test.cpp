#include <gtest/gtest.h>
#include "test_helpers.h"
#include "Animation/PlaybackScheduler.h"

TEST(PlaybackSchedulerTest, WrapsToStartAtDurationBoundary) {
    Scene scene;
    scene.setDuration(10.0);
    PlaybackScheduler scheduler(&scene);
    scheduler.setFrameRate(30);

    scheduler.seek(9.98);
    scheduler.play();

    int advances = 0;
    QObject::connect(&scheduler, &PlaybackScheduler::frameAdvanced, [&advances]() { ++advances; });
    ASSERT_TRUE(testutil::waitFor([&advances]() { return advances >= 1; }));
    scheduler.pause();

    ASSERT_EQ(advances, 1);
    EXPECT_GE(scene.getCurrentTime(), 0.0);
    EXPECT_LT(scene.getCurrentTime(), 1.0 / 30.0);
}

TEST(PlaybackSchedulerTest, AdvanceMovesOneFrame) {
    Scene scene;
    PlaybackScheduler scheduler(&scene);
    scheduler.setFrameRate(25);

    scheduler.seek(1.0);
    scheduler.advanceFrame();
    EXPECT_NEAR(scene.getCurrentTime(), 1.04, 1e-12);
}

TEST(PlaybackSchedulerTest, StopResetsTimeAndState) {
    Scene scene;
    PlaybackScheduler scheduler(&scene);

    scheduler.seek(4.0);
    scheduler.play();
    EXPECT_TRUE(scheduler.isPlaying());

    scheduler.stop();
    EXPECT_FALSE(scheduler.isPlaying());
    EXPECT_EQ(scheduler.getState(), PlaybackScheduler::State::Stopped);
    EXPECT_DOUBLE_EQ(scene.getCurrentTime(), 0.0);
}

TEST(PlaybackSchedulerTest, NoStrayAdvanceAfterStop) {
    Scene scene;
    PlaybackScheduler scheduler(&scene);
    scheduler.setFrameRate(60);

    int advances = 0;
    QObject::connect(&scheduler, &PlaybackScheduler::frameAdvanced, [&advances]() { ++advances; });

    scheduler.play();
    ASSERT_TRUE(testutil::waitFor([&advances]() { return advances >= 2; }));
    scheduler.stop();
    const int countAtStop = advances;

    testutil::spinEventLoop(150);
    EXPECT_EQ(advances, countAtStop);
    EXPECT_DOUBLE_EQ(scene.getCurrentTime(), 0.0);
}

TEST(PlaybackSchedulerTest, PauseKeepsCurrentTime) {
    Scene scene;
    PlaybackScheduler scheduler(&scene);
    scheduler.setFrameRate(60);

    int advances = 0;
    QObject::connect(&scheduler, &PlaybackScheduler::frameAdvanced, [&advances]() { ++advances; });

    scheduler.play();
    ASSERT_TRUE(testutil::waitFor([&advances]() { return advances >= 3; }));
    scheduler.pause();
    const double pausedAt = scene.getCurrentTime();
    EXPECT_GT(pausedAt, 0.0);

    testutil::spinEventLoop(100);
    EXPECT_DOUBLE_EQ(scene.getCurrentTime(), pausedAt);
    EXPECT_EQ(scheduler.getState(), PlaybackScheduler::State::Paused);
}

TEST(PlaybackSchedulerTest, ToggleStopsAndRewinds) {
    Scene scene;
    PlaybackScheduler scheduler(&scene);

    scheduler.seek(2.0);
    scheduler.togglePlayback();
    EXPECT_TRUE(scheduler.isPlaying());
    scheduler.togglePlayback();
    EXPECT_FALSE(scheduler.isPlaying());
    EXPECT_DOUBLE_EQ(scene.getCurrentTime(), 0.0);
}

TEST(PlaybackSchedulerTest, StepFramesIsClampedToProject) {
    Scene scene;
    scene.setDuration(2.0);
    PlaybackScheduler scheduler(&scene);
    scheduler.setFrameRate(10);

    scheduler.stepFrames(5);
    EXPECT_NEAR(scene.getCurrentTime(), 0.5, 1e-12);
    scheduler.stepFrames(-100);
    EXPECT_DOUBLE_EQ(scene.getCurrentTime(), 0.0);
    scheduler.seekRelative(100.0);
    EXPECT_DOUBLE_EQ(scene.getCurrentTime(), 2.0);
}

TEST(PlaybackSchedulerTest, RejectsInvalidFrameRate) {
    Scene scene;
    PlaybackScheduler scheduler(&scene);

    EXPECT_FALSE(scheduler.setFrameRate(0));
    EXPECT_FALSE(scheduler.setFrameRate(-24));
    EXPECT_EQ(scheduler.getFrameRate(), 30);
    EXPECT_EQ(scheduler.getFrameIntervalMs(), 33);
}
