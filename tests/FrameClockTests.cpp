#include <gtest/gtest.h>
#include "../src/FrameClock.h"
#include "../src/TileTypes.h"

class FrameClockTest : public ::testing::Test
{
protected:
    FrameClock clock;

    void SetUp() override
    {
        clock.Initialize();
    }
};

// --- Update Tests ---

TEST_F(FrameClockTest, Initialize_StartsAtZero)
{
    EXPECT_FLOAT_EQ(clock.GetElapsed(), 0.0f);
    EXPECT_EQ(clock.GetFrameIndex(), 0u);
    EXPECT_FLOAT_EQ(clock.GetTimeScale(), 1.0f);
    EXPECT_FALSE(clock.IsPaused());
}

TEST_F(FrameClockTest, Update_AccumulatesTime)
{
    clock.Update(0.5f);
    clock.Update(0.25f);
    EXPECT_FLOAT_EQ(clock.GetElapsed(), 0.75f);
    EXPECT_EQ(clock.GetFrameIndex(), 2u);
    EXPECT_FLOAT_EQ(clock.GetLastDelta(), 0.25f);
}

TEST_F(FrameClockTest, Update_AppliesTimeScale)
{
    clock.SetTimeScale(2.0f);
    clock.Update(0.5f);
    EXPECT_FLOAT_EQ(clock.GetElapsed(), 1.0f);
}

TEST_F(FrameClockTest, Update_NegativeDeltaClampsAtZero)
{
    clock.Update(0.1f);
    clock.Update(-1.0f);
    EXPECT_FLOAT_EQ(clock.GetElapsed(), 0.0f);
}

// --- Pause Tests ---

TEST_F(FrameClockTest, Paused_FreezesTimeButCountsFrames)
{
    clock.Update(1.0f);
    clock.SetPaused(true);
    clock.Update(1.0f);
    EXPECT_FLOAT_EQ(clock.GetElapsed(), 1.0f);
    EXPECT_FLOAT_EQ(clock.GetLastDelta(), 0.0f);
    EXPECT_EQ(clock.GetFrameIndex(), 2u);
}

TEST_F(FrameClockTest, Paused_SetTimeStillApplies)
{
    clock.SetPaused(true);
    clock.SetTime(4.0f);
    EXPECT_FLOAT_EQ(clock.GetElapsed(), 4.0f);
}

// --- Control Tests ---

TEST_F(FrameClockTest, SetTime_ClampsNegative)
{
    clock.SetTime(-3.0f);
    EXPECT_FLOAT_EQ(clock.GetElapsed(), 0.0f);
}

TEST_F(FrameClockTest, SetTimeScale_ClampsNegative)
{
    clock.SetTimeScale(-2.0f);
    EXPECT_FLOAT_EQ(clock.GetTimeScale(), 0.0f);
    clock.Update(1.0f);
    EXPECT_FLOAT_EQ(clock.GetElapsed(), 0.0f);
}

TEST_F(FrameClockTest, Initialize_ResetsEverything)
{
    clock.SetTimeScale(3.0f);
    clock.SetPaused(true);
    clock.Update(1.0f);
    clock.Initialize();
    EXPECT_FLOAT_EQ(clock.GetElapsed(), 0.0f);
    EXPECT_FLOAT_EQ(clock.GetTimeScale(), 1.0f);
    EXPECT_EQ(clock.GetFrameIndex(), 0u);
    EXPECT_FALSE(clock.IsPaused());
}

// --- Animation Sampling ---

TEST_F(FrameClockTest, AnimationFrame_AdvancesWithElapsedTime)
{
    AnimatedTile water({4, 5, 6}, 0.25f);

    EXPECT_EQ(water.GetFrameAtTime(clock.GetElapsed()), 4);
    clock.Update(0.3f);
    EXPECT_EQ(water.GetFrameAtTime(clock.GetElapsed()), 5);
    clock.Update(0.25f);
    EXPECT_EQ(water.GetFrameAtTime(clock.GetElapsed()), 6);
    clock.Update(0.25f);
    EXPECT_EQ(water.GetFrameAtTime(clock.GetElapsed()), 4);
}

TEST_F(FrameClockTest, AnimationFrame_EmptyFramesIsInvalid)
{
    AnimatedTile empty;
    EXPECT_EQ(empty.GetFrameAtTime(1.0f), -1);
}
