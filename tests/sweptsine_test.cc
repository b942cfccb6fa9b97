#include "support/sweptsine.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

using Xcorr::TestSupport::sweptSine;

TEST(SweptSineTest, SilenceFollowsSweep) {
    const auto samples = sweptSine(100.F, 4000.F, 256, 64, 16000, 0.5F);
    ASSERT_EQ(samples.size(), 320U);
    EXPECT_TRUE(std::all_of(samples.begin(), samples.end(), [](float s) { return std::abs(s) <= 0.5F; }));
    EXPECT_TRUE(std::all_of(samples.begin() + 256, samples.end(), [](float s) { return s == 0.F; }));
}

TEST(SweptSineTest, DelayShiftsSignal) {
    const auto reference = sweptSine(100.F, 4000.F, 256, 64, 16000, 1.F);
    const auto delayed   = sweptSine(100.F, 4000.F, 256, 64, 16000, 1.F, 10);
    ASSERT_EQ(delayed.size(), reference.size());
    for(std::size_t i = 0; i < 10; ++i) { EXPECT_EQ(delayed[i], 0.F); }
    for(std::size_t i = 10; i < delayed.size(); ++i) { EXPECT_EQ(delayed[i], reference[i - 10]); }
}

TEST(SweptSineTest, DelayPastEndTruncates) {
    const auto delayed = sweptSine(100.F, 4000.F, 16, 0, 16000, 1.F, 20);
    ASSERT_EQ(delayed.size(), 16U);
    EXPECT_TRUE(std::all_of(delayed.begin(), delayed.end(), [](float s) { return s == 0.F; }));
}
