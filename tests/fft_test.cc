#include "errors.hh"
#include "fft.hh"

#include <gtest/gtest.h>

#include <limits>

using namespace Xcorr;

TEST(FftTest, ImpulseHasFlatSpectrum) {
    const std::vector<float> impulse{1.F, 0.F, 0.F, 0.F};
    const auto spectrum = Fft::r2c(impulse, 8);
    ASSERT_EQ(spectrum.size(), 5U);
    for(const auto &bin : spectrum) {
        EXPECT_NEAR(bin.real(), 1.F, 1e-6F);
        EXPECT_NEAR(bin.imag(), 0.F, 1e-6F);
    }
}

TEST(FftTest, ZeroPadsToTransformLength) {
    const std::vector<float> input{1.F, 1.F};
    const auto spectrum = Fft::r2c(input, 4);
    ASSERT_EQ(spectrum.size(), 3U);
    EXPECT_NEAR(spectrum[0].real(), 2.F, 1e-6F);
    EXPECT_NEAR(spectrum[1].real(), 1.F, 1e-6F);
    EXPECT_NEAR(spectrum[1].imag(), -1.F, 1e-6F);
    EXPECT_NEAR(std::abs(spectrum[2]), 0.F, 1e-6F);
}

TEST(FftTest, InverseIsUnnormalized) {
    const std::vector<float> input{0.5F, -1.F, 2.F, 0.25F, 0.F, 3.F};
    const auto samples = Fft::c2r(Fft::r2c(input, 8), 8);
    ASSERT_EQ(samples.size(), 8U);
    for(std::size_t i = 0; i < samples.size(); ++i) {
        const auto expected = i < input.size() ? input[i] : 0.F;
        EXPECT_NEAR(samples[i], 8.F * expected, 1e-4F);
    }
}

TEST(FftTest, BatchedRowsAreIndependent) {
    const std::vector<float> rows{1.F, 0.F, 0.F, 1.F};
    const auto spectrum = Fft::r2c(rows, 4, 2);
    ASSERT_EQ(spectrum.size(), 6U);
    // Impulse at 0, then impulse at 1
    EXPECT_NEAR(spectrum[1].real(), 1.F, 1e-6F);
    EXPECT_NEAR(spectrum[4].real(), 0.F, 1e-6F);
    EXPECT_NEAR(spectrum[4].imag(), -1.F, 1e-6F);
}

TEST(FftTest, RejectsInconsistentSizes) {
    const std::vector<float> rows(5);
    EXPECT_THROW(Fft::r2c(rows, 8, 2), ShapeError);
    EXPECT_THROW(Fft::r2c(rows, 4), ShapeError);
    const std::vector<Fft::ComplexFloat> bins(4);
    EXPECT_THROW(Fft::c2r(bins, 8), ShapeError);
}

TEST(FftTest, RejectsSizesBeyondIntRange) {
    const auto tooLong = static_cast<std::size_t>(std::numeric_limits<int>::max()) + 1;
    const std::vector<float> samples(2);
    EXPECT_THROW(Fft::r2c(samples, tooLong), ShapeError);
    const std::vector<float> none;
    EXPECT_THROW(Fft::r2c(none, 8, tooLong), ShapeError);
    const std::vector<Fft::ComplexFloat> bins(5);
    EXPECT_THROW(Fft::c2r(bins, tooLong), ShapeError);
    EXPECT_THROW(Fft::c2r(bins, 8, tooLong), ShapeError);
}
