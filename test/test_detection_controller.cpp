#include <gtest/gtest.h>
#include <random>

#include "detection_controller.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace testutil;

class DetectionControllerTests : public ::testing::Test {
    protected:
        DetectionControllerTests()
            : controller(model, params, stats, sink) {}

        void SetUp() override {
            base = SteadyClock::now();
            seq = 0;
        }

        CycleResult still(double t, int gray = BACKGROUND_GRAY) {
            return controller.processFrame(makeFrame(seq++, seconds(base, t), gray));
        }

        CycleResult blob(double t, const cv::Rect& r = BLOB_600) {
            return controller.processFrame(makeBlobFrame(seq++, seconds(base, t), r));
        }

        // Start and feed enough static frames to pass warm-up; returns the next free time
        double startAndWarmUp(double t = 0.0, int frames = 150) {
            controller.start();
            for (int i = 0; i < frames; ++i) {
                still(t);
                t += 0.033;
            }
            return t;
        }

        // Static frames between t0 and t1 keep the model anchored on the background
        void stillBetween(double t0, double t1, int frames = 10) {
            for (int i = 1; i <= frames; ++i) {
                still(t0 + (t1 - t0) * i / (frames + 1));
            }
        }

        BackgroundModel model;
        DetectionParameters params;
        StatsStore stats;
        RecordingSink sink;
        DetectionController controller;
        TimePoint base;
        uint64_t seq;
};

TEST_F(DetectionControllerTests, StartsIdle) {
    ASSERT_EQ(controller.getState(), DetectionState::Idle);
    ASSERT_FALSE(controller.isRunning());
    ASSERT_FALSE(controller.getLastTriggerTimestamp().has_value());
}

TEST_F(DetectionControllerTests, IdleIgnoresFrames) {
    CycleResult r = still(0.0);
    ASSERT_EQ(r.stateAfter, DetectionState::Idle);
    ASSERT_FALSE(r.evaluated);
    ASSERT_FALSE(r.triggered);
    ASSERT_EQ(stats.snapshot().framesProcessed, 0u);
    ASSERT_EQ(model.getFramesSeen(), 0);
}

TEST_F(DetectionControllerTests, RejectsInvalidTransitions) {
    ASSERT_THROW(controller.stop(), InvalidStateTransitionError);
    ASSERT_THROW(controller.pause(), InvalidStateTransitionError);
    ASSERT_THROW(controller.resume(), InvalidStateTransitionError);

    controller.start();
    ASSERT_THROW(controller.start(), InvalidStateTransitionError);
    ASSERT_THROW(controller.resume(), InvalidStateTransitionError);

    controller.pause();
    ASSERT_EQ(controller.getState(), DetectionState::Paused);
    ASSERT_THROW(controller.pause(), InvalidStateTransitionError);
    ASSERT_THROW(controller.start(), InvalidStateTransitionError);

    controller.resume();
    ASSERT_EQ(controller.getState(), DetectionState::Monitoring);
    controller.stop();
    ASSERT_EQ(controller.getState(), DetectionState::Idle);
}

TEST_F(DetectionControllerTests, StopFromPausedGoesIdle) {
    controller.start();
    controller.pause();
    controller.stop();
    ASSERT_EQ(controller.getState(), DetectionState::Idle);
}

TEST_F(DetectionControllerTests, StaticSceneNeverTriggers) {
    double t = startAndWarmUp();
    for (int i = 0; i < 100; ++i) {
        CycleResult r = still(t);
        t += 0.033;
        ASSERT_TRUE(r.evaluated);
        ASSERT_FALSE(r.triggered);
    }
    ASSERT_EQ(stats.totalDetections(), 0u);
    ASSERT_EQ(sink.count(), 0u);
    ASSERT_TRUE(controller.isModelConverged());
}

TEST_F(DetectionControllerTests, WarmupSuppressesTriggers) {
    controller.start();
    double t = 0.0;
    for (int i = 0; i < 10; ++i) {
        still(t);
        t += 0.033;
    }

    CycleResult r = blob(t);
    ASSERT_FALSE(r.evaluated);
    ASSERT_FALSE(r.triggered);
    ASSERT_EQ(r.stateAfter, DetectionState::Monitoring);
    ASSERT_FALSE(controller.isModelConverged());
    ASSERT_EQ(stats.totalDetections(), 0u);
}

TEST_F(DetectionControllerTests, BlobTriggersThenCooldownSuppresses) {
    const double t0 = startAndWarmUp();

    // Blob at T0: 600 px against minimum 500
    CycleResult first = blob(t0);
    ASSERT_TRUE(first.triggered);
    ASSERT_EQ(first.stateAfter, DetectionState::Cooldown);
    ASSERT_EQ(first.totalMotionArea, 600);
    ASSERT_EQ(stats.totalDetections(), 1u);
    ASSERT_EQ(*stats.snapshot().lastDetectionTimestamp, seconds(base, t0));
    ASSERT_EQ(sink.count(), 1u);
    ASSERT_EQ(sink.getEvents()[0].sequence, 1u);
    ASSERT_EQ(sink.getEvents()[0].regionCount, 1);
    ASSERT_FALSE(sink.getEvents()[0].manual);

    // Blob at T0 + 2 s: still cooling down
    stillBetween(t0, t0 + 2.0);
    CycleResult second = blob(t0 + 2.0);
    ASSERT_TRUE(second.evaluated);
    ASSERT_FALSE(second.triggered);
    ASSERT_EQ(second.stateAfter, DetectionState::Cooldown);
    ASSERT_EQ(stats.totalDetections(), 1u);
    ASSERT_NEAR(controller.getCooldownRemaining(seconds(base, t0 + 2.0)), 3.0, 1e-6);

    // Blob at T0 + 6 s: cooldown over, the same frame fires
    stillBetween(t0 + 2.0, t0 + 4.0);
    CycleResult third = blob(t0 + 6.0);
    ASSERT_TRUE(third.triggered);
    ASSERT_EQ(third.stateBefore, DetectionState::Cooldown);
    ASSERT_EQ(stats.totalDetections(), 2u);
    ASSERT_EQ(sink.count(), 2u);
    ASSERT_EQ(*controller.getLastTriggerTimestamp(), seconds(base, t0 + 6.0));
}

TEST_F(DetectionControllerTests, CooldownEndsWithoutMotion) {
    const double t0 = startAndWarmUp();
    ASSERT_TRUE(blob(t0).triggered);

    CycleResult r = still(t0 + 5.5);
    ASSERT_EQ(r.stateAfter, DetectionState::Monitoring);
    ASSERT_FALSE(r.triggered);
    ASSERT_DOUBLE_EQ(controller.getCooldownRemaining(seconds(base, t0 + 5.5)), 0.0);
}

TEST_F(DetectionControllerTests, BlobBelowMinimumAreaIgnored) {
    const double t0 = startAndWarmUp();
    params.setMinMotionArea(700);

    CycleResult r = blob(t0);
    ASSERT_TRUE(r.evaluated);
    ASSERT_TRUE(r.regions.empty());
    ASSERT_FALSE(r.triggered);
    ASSERT_EQ(r.stateAfter, DetectionState::Monitoring);
    ASSERT_EQ(stats.totalDetections(), 0u);
}

TEST_F(DetectionControllerTests, AreaChangeAfterTriggerDoesNotCancelIt) {
    const double t0 = startAndWarmUp();
    ASSERT_TRUE(blob(t0).triggered);

    params.setMinMotionArea(2000);
    ASSERT_EQ(stats.totalDetections(), 1u);
    ASSERT_EQ(controller.getState(), DetectionState::Cooldown);
    ASSERT_EQ(sink.count(), 1u);

    // The new minimum applies to later frames
    stillBetween(t0, t0 + 6.0);
    ASSERT_FALSE(blob(t0 + 6.0).triggered);
}

TEST_F(DetectionControllerTests, CooldownLengthCapturedAtTrigger) {
    const double t0 = startAndWarmUp();
    ASSERT_TRUE(blob(t0).triggered);

    // Longer cooldown set mid-cooldown; the running one stays 5 s
    params.setCooldownSeconds(30.0);
    stillBetween(t0, t0 + 6.0);
    ASSERT_TRUE(blob(t0 + 6.0).triggered);

    // This trigger captured 30 s
    stillBetween(t0 + 6.0, t0 + 16.0);
    ASSERT_FALSE(blob(t0 + 16.0).triggered);
    stillBetween(t0 + 16.0, t0 + 36.0);
    ASSERT_TRUE(blob(t0 + 36.5).triggered);
    ASSERT_EQ(stats.totalDetections(), 3u);
}

TEST_F(DetectionControllerTests, PausedModelKeepsLearning) {
    double t = startAndWarmUp();
    controller.pause();

    // Scene changes while paused; no evaluation, but the model adapts
    for (int i = 0; i < 250; ++i) {
        CycleResult r = still(t, 150);
        t += 0.033;
        ASSERT_FALSE(r.evaluated);
        ASSERT_FALSE(r.triggered);
        ASSERT_EQ(r.stateAfter, DetectionState::Paused);
    }

    controller.resume();
    CycleResult r = still(t, 150);
    ASSERT_TRUE(r.evaluated);
    ASSERT_FALSE(r.triggered);
    ASSERT_EQ(r.totalMotionArea, 0);
    ASSERT_EQ(stats.totalDetections(), 0u);
}

TEST_F(DetectionControllerTests, PausedBlobDoesNotTrigger) {
    const double t0 = startAndWarmUp();
    controller.pause();
    CycleResult r = blob(t0);
    ASSERT_FALSE(r.triggered);
    ASSERT_EQ(sink.count(), 0u);
    ASSERT_EQ(stats.snapshot().framesProcessed, 151u);
}

TEST_F(DetectionControllerTests, ResumeReturnsToPendingCooldown) {
    const double t0 = startAndWarmUp();
    ASSERT_TRUE(blob(t0).triggered);

    controller.pause();
    ASSERT_EQ(controller.getState(), DetectionState::Paused);
    ASSERT_NEAR(controller.getCooldownRemaining(seconds(base, t0 + 1.0)), 4.0, 1e-6);
    stillBetween(t0, t0 + 1.5);

    controller.resume();
    ASSERT_EQ(controller.getState(), DetectionState::Cooldown);

    stillBetween(t0 + 1.5, t0 + 2.0);
    ASSERT_FALSE(blob(t0 + 2.0).triggered);

    stillBetween(t0 + 2.0, t0 + 6.0);
    ASSERT_TRUE(blob(t0 + 6.0).triggered);
    ASSERT_EQ(stats.totalDetections(), 2u);
}

TEST_F(DetectionControllerTests, RestartKeepsStatisticsAndRelearns) {
    double t = startAndWarmUp();
    ASSERT_TRUE(blob(t).triggered);

    controller.stop();
    ASSERT_EQ(controller.getState(), DetectionState::Idle);
    ASSERT_FALSE(controller.getLastTriggerTimestamp().has_value());
    ASSERT_EQ(stats.totalDetections(), 1u);

    // New session: model starts over, no cooldown carried across
    t = startAndWarmUp(t + 0.5);
    ASSERT_EQ(stats.totalDetections(), 1u);
    ASSERT_TRUE(blob(t).triggered);
    ASSERT_EQ(stats.totalDetections(), 2u);
    ASSERT_EQ(sink.getEvents()[1].sequence, 2u);
}

TEST_F(DetectionControllerTests, RestartClearsConvergenceImmediately) {
    startAndWarmUp();
    ASSERT_TRUE(controller.isModelConverged());

    controller.stop();
    ASSERT_TRUE(controller.isModelConverged());

    // No frame processed yet in the new session
    controller.start();
    ASSERT_FALSE(controller.isModelConverged());
}

TEST_F(DetectionControllerTests, MalformedFrameIsSkipped) {
    double t = startAndWarmUp();

    Frame broken;
    broken.timestamp = seconds(base, t);
    CycleResult r = controller.processFrame(broken);
    ASSERT_TRUE(r.skipped);
    ASSERT_FALSE(r.triggered);
    ASSERT_EQ(r.stateAfter, DetectionState::Monitoring);

    Frame wrongSize;
    wrongSize.image = cv::Mat(30, 40, CV_8UC1, cv::Scalar(BACKGROUND_GRAY));
    wrongSize.timestamp = seconds(base, t);
    ASSERT_TRUE(controller.processFrame(wrongSize).skipped);

    ASSERT_EQ(stats.snapshot().framesSkipped, 2u);
    ASSERT_EQ(controller.getState(), DetectionState::Monitoring);

    // Next good frame is processed normally
    ASSERT_TRUE(blob(t + 0.033).triggered);
}

TEST_F(DetectionControllerTests, SensitivityChangesReachTheModel) {
    startAndWarmUp();
    params.setSensitivityThreshold(60.0);
    still(10.0);
    ASSERT_DOUBLE_EQ(model.getVarThreshold(), 60.0);
}

/*
    Random walk over blobs of three sizes, time gaps, parameter changes and
    pause/resume. Whatever the sequence, every committed trigger is counted
    exactly once, successive triggers are at least the captured cooldown
    apart, and no reported region is smaller than the minimum in effect.
*/
TEST_F(DetectionControllerTests, RandomSequencesKeepInvariants) {
    std::mt19937 rng(20241031);
    std::uniform_real_distribution<double> gap(0.05, 2.0);
    std::uniform_int_distribution<int> percent(0, 99);
    std::uniform_int_distribution<int> areaChoice(1, 20);
    std::uniform_int_distribution<int> cooldownChoice(1, 30);

    const cv::Size blobSizes[] = {cv::Size(10, 10), cv::Size(20, 30), cv::Size(30, 40)};

    double t = startAndWarmUp();
    size_t triggers = 0;
    std::optional<double> lastTrigger;
    double cooldownAtLastTrigger = 0.0;

    for (int step = 0; step < 1500; ++step) {
        int p = percent(rng);
        if (p < 3) {
            params.setMinMotionArea(areaChoice(rng) * 100);
        } else if (p < 6) {
            params.setCooldownSeconds(static_cast<double>(cooldownChoice(rng)));
        } else if (p < 8) {
            DetectionState s = controller.getState();
            if (s == DetectionState::Paused) controller.resume();
            else controller.pause();
        }

        t += gap(rng);
        const int minArea = params.getMinMotionArea();
        const double cooldown = params.getCooldownSeconds();

        CycleResult r;
        if (percent(rng) < 10) {
            cv::Size size = blobSizes[percent(rng) % 3];
            std::uniform_int_distribution<int> xs(0, FRAME_WIDTH - size.width);
            std::uniform_int_distribution<int> ys(0, FRAME_HEIGHT - size.height);
            r = blob(t, cv::Rect(cv::Point(xs(rng), ys(rng)), size));
        } else {
            r = still(t);
        }

        for (const Region& region : r.regions) {
            ASSERT_GE(region.area, minArea);
        }
        if (r.triggered) {
            ASSERT_NE(r.stateBefore, DetectionState::Paused);
            if (lastTrigger) {
                ASSERT_GE(t - *lastTrigger, cooldownAtLastTrigger - 1e-6);
            }
            lastTrigger = t;
            cooldownAtLastTrigger = cooldown;
            triggers++;
        }
    }

    ASSERT_GT(triggers, 0u);
    ASSERT_EQ(stats.totalDetections(), triggers);
    ASSERT_EQ(sink.count(), triggers);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
