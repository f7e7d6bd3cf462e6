// VELOCK - Decay Line Tests
// Copyright (c) 2024 VELOCK Developers
// MIT License

#include <gtest/gtest.h>
#include <velock/staking/decayline.h>

#include <vector>

using namespace velock;
using namespace velock::staking;

// ============================================================================
// Single Steps
// ============================================================================

TEST(LineStepTest, ForwardAddsDepositThenDecays) {
    Line line{1000, 100};
    ASSERT_TRUE(StepForward(line, 50, -30));
    EXPECT_EQ(line.bias, 950u);
    EXPECT_EQ(line.slope, 70);
}

TEST(LineStepTest, BackwardUndoesForward) {
    Line line{1000, 100};
    Line original = line;
    ASSERT_TRUE(StepForward(line, 50, -30));
    ASSERT_TRUE(StepBackward(line, 50, -30));
    EXPECT_EQ(line, original);
}

TEST(LineStepTest, ForwardUnderflowLeavesLineUntouched) {
    Line line{40, 100};
    ErrorCode error = ErrorCode::OK;
    EXPECT_FALSE(StepForward(line, 0, 0, &error));
    EXPECT_EQ(error, ErrorCode::ArithmeticUnderflow);
    EXPECT_EQ(line.bias, 40u);
    EXPECT_EQ(line.slope, 100);
}

TEST(LineStepTest, BackwardUnderflowOnLargeDeposit) {
    Line line{10, 0};
    ErrorCode error = ErrorCode::OK;
    EXPECT_FALSE(StepBackward(line, 500, 0, &error));
    EXPECT_EQ(error, ErrorCode::ArithmeticUnderflow);
    EXPECT_EQ(line.bias, 10u);
}

TEST(LineStepTest, ForwardOverflow) {
    Line line{MAX_AMOUNT - 5, 0};
    ErrorCode error = ErrorCode::OK;
    EXPECT_FALSE(StepForward(line, 10, 0, &error));
    EXPECT_EQ(error, ErrorCode::ArithmeticOverflow);
}

// ============================================================================
// Test Fixture
// ============================================================================

class DecayLineTest : public ::testing::Test {
protected:
    Amount BiasAt(const DecayLine& line, Epoch epoch) {
        auto at = line.LineAt(epoch);
        EXPECT_TRUE(at.has_value()) << "replay to " << epoch << " failed";
        return at ? at->bias : 0;
    }
};

// ============================================================================
// Reference Example
// ============================================================================

TEST_F(DecayLineTest, LockOfThousandOverTenEpochs) {
    DecayLine line(5);
    ASSERT_TRUE(line.ScheduleRamp(5, 15, 1000, 100));

    EXPECT_EQ(BiasAt(line, 5), 1000u);
    EXPECT_EQ(BiasAt(line, 10), 500u);
    EXPECT_EQ(BiasAt(line, 15), 0u);
    EXPECT_EQ(BiasAt(line, 30), 0u);
    EXPECT_EQ(BiasAt(line, 4), 0u);

    auto end = line.LineAt(15);
    ASSERT_TRUE(end);
    EXPECT_EQ(end->slope, 0);
}

TEST_F(DecayLineTest, DecaysLinearly) {
    DecayLine line(1);
    ASSERT_TRUE(line.ScheduleRamp(1, 9, 800, 100));
    for (Epoch e = 1; e <= 9; ++e) {
        EXPECT_EQ(BiasAt(line, e), 800u - 100u * (e - 1));
    }
}

TEST_F(DecayLineTest, DustRemainsBelowDuration) {
    DecayLine line(3);
    const Amount amount = 1007;
    const Epoch duration = 10;
    ASSERT_TRUE(line.ScheduleRamp(3, 3 + duration, amount, amount / duration));

    Amount dust = BiasAt(line, 3 + duration);
    EXPECT_EQ(dust, 7u);
    EXPECT_LT(dust, duration);
    EXPECT_EQ(BiasAt(line, 100), dust);
}

// ============================================================================
// Replay Symmetry
// ============================================================================

TEST_F(DecayLineTest, ForwardAndBackwardReplayAgree) {
    DecayLine early(3);
    ASSERT_TRUE(early.ScheduleRamp(3, 13, 1000, 100));
    ASSERT_TRUE(early.ScheduleRamp(3, 7, 400, 100));
    ASSERT_TRUE(early.ScheduleRamp(6, 18, 1200, 100));
    ASSERT_TRUE(early.ScheduleRamp(9, 13, 90, 22));

    DecayLine late = early;
    ASSERT_TRUE(late.CommitAdvance(20));
    EXPECT_EQ(late.GetLastUpdateEpoch(), 20u);

    for (Epoch e = 2; e <= 22; ++e) {
        auto forward = early.LineAt(e);
        auto backward = late.LineAt(e);
        ASSERT_TRUE(forward) << "epoch " << e;
        ASSERT_TRUE(backward) << "epoch " << e;
        EXPECT_EQ(*forward, *backward) << "epoch " << e;
    }
}

TEST_F(DecayLineTest, LineAtDoesNotMoveAnchor) {
    DecayLine line(5);
    ASSERT_TRUE(line.ScheduleRamp(5, 15, 1000, 100));
    DecayLine copy = line;

    BiasAt(line, 12);
    BiasAt(line, 1);
    EXPECT_EQ(line, copy);
}

TEST_F(DecayLineTest, CommitAdvanceNeverRewinds) {
    DecayLine line(5);
    ASSERT_TRUE(line.ScheduleRamp(5, 15, 1000, 100));
    ASSERT_TRUE(line.CommitAdvance(8));
    EXPECT_EQ(line.GetLine().bias, 700u);

    EXPECT_TRUE(line.CommitAdvance(6));
    EXPECT_EQ(line.GetLastUpdateEpoch(), 8u);
    EXPECT_EQ(line.GetLine().bias, 700u);
}

// ============================================================================
// Ramps Relative to the Anchor
// ============================================================================

TEST_F(DecayLineTest, RampStartingBeforeAnchorIsFoldedIn) {
    DecayLine line(10);
    ASSERT_TRUE(line.ScheduleRamp(5, 15, 1000, 100));

    EXPECT_EQ(line.GetLine().bias, 500u);
    EXPECT_EQ(line.GetLine().slope, 100);
    EXPECT_EQ(BiasAt(line, 5), 1000u);
    EXPECT_EQ(BiasAt(line, 4), 0u);
    EXPECT_EQ(BiasAt(line, 15), 0u);
}

TEST_F(DecayLineTest, RampEndedBeforeAnchorLeavesOnlyDust) {
    DecayLine line(20);
    ASSERT_TRUE(line.ScheduleRamp(5, 15, 1005, 100));

    EXPECT_EQ(line.GetLine().bias, 5u);
    EXPECT_EQ(line.GetLine().slope, 0);
    EXPECT_EQ(BiasAt(line, 10), 505u);
}

TEST_F(DecayLineTest, FutureRampOnlyRecordsDeltas) {
    DecayLine line(2);
    ASSERT_TRUE(line.ScheduleRamp(6, 10, 400, 100));

    EXPECT_EQ(line.GetLine().bias, 0u);
    EXPECT_EQ(line.GetDeposit(6), 400u);
    EXPECT_EQ(line.GetSlopeChange(6), 100);
    EXPECT_EQ(line.GetSlopeChange(10), -100);
    EXPECT_EQ(BiasAt(line, 5), 0u);
    EXPECT_EQ(BiasAt(line, 6), 400u);
    EXPECT_EQ(BiasAt(line, 8), 200u);
}

TEST_F(DecayLineTest, OverlappingRampsShareEpochs) {
    DecayLine line(1);
    ASSERT_TRUE(line.ScheduleRamp(1, 5, 400, 100));
    ASSERT_TRUE(line.ScheduleRamp(1, 5, 800, 200));

    EXPECT_EQ(line.GetDeposit(1), 1200u);
    EXPECT_EQ(line.GetSlopeChange(1), 300);
    EXPECT_EQ(line.GetSlopeChange(5), -300);
    EXPECT_EQ(line.GetDeltaCount(), 2u);
    EXPECT_EQ(BiasAt(line, 3), 600u);
}

// ============================================================================
// Validation and Rollback
// ============================================================================

TEST_F(DecayLineTest, RejectsEmptyRange) {
    DecayLine line(5);
    ErrorCode error = ErrorCode::OK;
    EXPECT_FALSE(line.ScheduleRamp(5, 5, 100, 10, &error));
    EXPECT_EQ(error, ErrorCode::InvalidDuration);
    EXPECT_FALSE(line.ScheduleRamp(7, 6, 100, 10, &error));
    EXPECT_EQ(error, ErrorCode::InvalidDuration);
    EXPECT_TRUE(line.IsEmpty());
}

TEST_F(DecayLineTest, RejectsNegativeSlope) {
    DecayLine line(5);
    ErrorCode error = ErrorCode::OK;
    EXPECT_FALSE(line.ScheduleRamp(5, 10, 100, -1, &error));
    EXPECT_EQ(error, ErrorCode::InvalidAmount);
    EXPECT_TRUE(line.IsEmpty());
}

TEST_F(DecayLineTest, RampDecayingPastZeroIsRejected) {
    DecayLine line(10);
    ErrorCode error = ErrorCode::OK;
    EXPECT_FALSE(line.ScheduleRamp(5, 15, 100, 50, &error));
    EXPECT_EQ(error, ErrorCode::ArithmeticUnderflow);
    EXPECT_TRUE(line.IsEmpty());
}

TEST_F(DecayLineTest, CancelAndRestoreUndoRamp) {
    DecayLine line(5);
    ASSERT_TRUE(line.ScheduleRamp(5, 15, 1000, 100));
    ASSERT_TRUE(line.AddDeposited(1000));
    const DecayLine before = line;

    auto saved = line.Save();
    ASSERT_TRUE(line.ScheduleRamp(5, 9, 400, 100));
    ASSERT_TRUE(line.AddDeposited(400));
    EXPECT_NE(line, before);

    line.CancelRamp(5, 9, 400, 100);
    line.Restore(saved);
    EXPECT_EQ(line, before);
}

TEST_F(DecayLineTest, DepositedTracksPrincipal) {
    DecayLine line;
    EXPECT_TRUE(line.AddDeposited(500));
    EXPECT_FALSE(line.SubDeposited(501));
    EXPECT_EQ(line.GetDeposited(), 500u);
    EXPECT_TRUE(line.SubDeposited(200));
    EXPECT_EQ(line.GetDeposited(), 300u);
    EXPECT_FALSE(line.AddDeposited(MAX_AMOUNT));
}

// ============================================================================
// Serialization
// ============================================================================

TEST_F(DecayLineTest, SerializationPreservesLine) {
    DecayLine line(4);
    ASSERT_TRUE(line.ScheduleRamp(4, 12, 800, 100));
    ASSERT_TRUE(line.ScheduleRamp(6, 10, 40, 10));
    ASSERT_TRUE(line.AddDeposited(840));
    ASSERT_TRUE(line.CommitAdvance(7));

    std::vector<Byte> bytes = line.Serialize();
    auto restored = DecayLine::Deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(restored);
    EXPECT_EQ(*restored, line);
    EXPECT_EQ(restored->Serialize(), bytes);
    EXPECT_EQ(BiasAt(*restored, 4), 800u);
}

TEST_F(DecayLineTest, DeserializeRejectsMalformedInput) {
    DecayLine line(4);
    ASSERT_TRUE(line.ScheduleRamp(4, 12, 800, 100));
    std::vector<Byte> bytes = line.Serialize();

    std::vector<Byte> truncated(bytes.begin(), bytes.end() - 1);
    EXPECT_FALSE(DecayLine::Deserialize(truncated.data(), truncated.size()));

    std::vector<Byte> trailing = bytes;
    trailing.push_back(0);
    EXPECT_FALSE(DecayLine::Deserialize(trailing.data(), trailing.size()));
}

TEST_F(DecayLineTest, ToStringMentionsAnchor) {
    DecayLine line(9);
    EXPECT_NE(line.ToString().find("anchor: 9"), std::string::npos);
}
