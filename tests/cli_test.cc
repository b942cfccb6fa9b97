#include "cli.hh"
#include "errors.hh"
#include "gcc.hh"

#include <gtest/gtest.h>

#include <sstream>

using namespace Xcorr;

TEST(MaxDelayTest, ParsesPositiveIntegers) {
    EXPECT_EQ(Cli::parseMaxDelay("5"), 5U);
    EXPECT_EQ(Cli::parseMaxDelay("1024"), 1024U);
}

TEST(MaxDelayTest, RejectsNegativeValues) {
    EXPECT_THROW(Cli::parseMaxDelay("-3"), ConfigError);
    EXPECT_THROW(Cli::parseMaxDelay("+3"), ConfigError);
}

TEST(MaxDelayTest, RejectsTrailingCharacters) {
    EXPECT_THROW(Cli::parseMaxDelay("5abc"), ConfigError);
    EXPECT_THROW(Cli::parseMaxDelay("5 "), ConfigError);
    EXPECT_THROW(Cli::parseMaxDelay("2.5"), ConfigError);
}

TEST(MaxDelayTest, RejectsZeroEmptyAndOverflow) {
    EXPECT_THROW(Cli::parseMaxDelay("0"), ConfigError);
    EXPECT_THROW(Cli::parseMaxDelay(""), ConfigError);
    EXPECT_THROW(Cli::parseMaxDelay("99999999999999999999999"), ConfigError);
}

TEST(ReadSamplesTest, SingleLineIsUnbatched) {
    std::istringstream input{"1 2.5 -3\n"};
    const auto x = Cli::readSamples(input, "x0");
    ASSERT_EQ(x.shape(), Shape{3});
    EXPECT_FLOAT_EQ(x[1], 2.5F);
}

TEST(ReadSamplesTest, LinesBecomeBatchRows) {
    std::istringstream input{"1 2 3 4\n\n5 6 7 8\n"};
    const auto x = Cli::readSamples(input, "x0");
    ASSERT_EQ(x.shape(), (Shape{2, 4}));
    EXPECT_FLOAT_EQ(x.at(1, 0), 5.F);
}

TEST(ReadSamplesTest, RejectsRaggedLines) {
    std::istringstream input{"1 2 3\n4 5\n"};
    EXPECT_THROW(Cli::readSamples(input, "x0"), ShapeError);
}

TEST(ReadSamplesTest, RejectsNonNumericTokens) {
    std::istringstream input{"1 2 abc 4\n"};
    EXPECT_THROW(Cli::readSamples(input, "x0"), Error);
}

TEST(ReadSamplesTest, RejectsEmptyInput) {
    std::istringstream input{"\n  \n"};
    EXPECT_THROW(Cli::readSamples(input, "x0"), Error);
    EXPECT_THROW(Cli::readSamples("/nonexistent/xcorr/samples.txt"), Error);
}

TEST(FormatCorrelationTest, EvenLengthLabelsExtraPositiveLag) {
    const RealArray correlation{std::vector<float>{0.5F, 1.F, 2.F, 1.F, 0.5F, 0.25F}};
    const auto lines = Cli::formatCorrelation(correlation);
    ASSERT_EQ(lines.size(), 1U);
    EXPECT_EQ(lines.front(), "-2:0.5 -1:1 0:2 1:1 2:0.5 3:0.25");
}

TEST(FormatCorrelationTest, OneLinePerRow) {
    const RealArray correlation{{2, 3}, {1.F, 2.F, 3.F, 4.F, 5.F, 6.F}};
    const auto lines = Cli::formatCorrelation(correlation);
    ASSERT_EQ(lines.size(), 2U);
    EXPECT_EQ(lines[0], "-1:1 0:2 1:3");
    EXPECT_EQ(lines[1], "-1:4 0:5 1:6");
}
