#include <gtest/gtest.h>

#include "BandCalculator.hpp"
#include "test_series_helpers.hpp"

#include <initializer_list>
#include <stdexcept>
#include <vector>

using namespace tdcore;
using test_helpers::series_from_closes;

namespace {

constexpr double kEps = 1e-12;

BandParameters params(int period, std::vector<int> multipliers,
                      MovingAverageKind kind = MovingAverageKind::Simple)
{
    BandParameters p;
    p.period = period;
    p.multipliers = std::move(multipliers);
    p.ma_kind = kind;
    return p;
}

} // namespace

TEST(BandCalculator, NoValuesBeforeFullWindow)
{
    auto bands = compute_bands(series_from_closes({1, 2, 3, 4, 5}), params(3, {2}));
    ASSERT_EQ(bands.size(), 5u);
    EXPECT_FALSE(bands[0].has_value());
    EXPECT_FALSE(bands[1].has_value());
    for (std::size_t i = 2; i < bands.size(); ++i) {
        EXPECT_TRUE(bands[i].has_value()) << "bar " << i;
    }
}

TEST(BandCalculator, SeriesShorterThanPeriodHasNoValues)
{
    auto bands = compute_bands(series_from_closes({1, 2}), params(3, {2}));
    ASSERT_EQ(bands.size(), 2u);
    EXPECT_FALSE(bands[0].has_value());
    EXPECT_FALSE(bands[1].has_value());
}

TEST(BandCalculator, SimpleBasisUsesSampleDeviation)
{
    auto bands = compute_bands(series_from_closes({1, 2, 3, 4, 5}), params(3, {1, 2}));
    const auto& b = *bands[2];

    EXPECT_NEAR(b.basis, 2.0, kEps);
    EXPECT_NEAR(b.stddev, 1.0, kEps);
    ASSERT_EQ(b.lines.size(), 2u);

    const BandLine* one = b.line(1);
    const BandLine* two = b.line(2);
    ASSERT_NE(one, nullptr);
    ASSERT_NE(two, nullptr);
    EXPECT_NEAR(one->upper, 3.0, kEps);
    EXPECT_NEAR(one->lower, 1.0, kEps);
    EXPECT_NEAR(two->upper, 4.0, kEps);
    EXPECT_NEAR(two->lower, 0.0, kEps);
    EXPECT_EQ(b.line(3), nullptr);
}

TEST(BandCalculator, EnvelopeWidthIsTwoKSigma)
{
    const std::vector<double> closes{10, 12, 11, 15, 14, 13, 18, 17, 16, 20};
    auto bands = compute_bands(series_from_closes(closes), params(4, {1, 2, 3}));

    for (std::size_t i = 3; i < bands.size(); ++i) {
        const auto& b = *bands[i];
        for (const auto& line : b.lines) {
            EXPECT_NEAR(line.upper - line.lower, 2.0 * line.multiplier * b.stddev, 1e-9) << "bar " << i;
            EXPECT_NEAR((line.upper + line.lower) / 2.0, b.basis, 1e-9) << "bar " << i;
        }
    }
}

TEST(BandCalculator, FlatSeriesCollapsesBands)
{
    for (auto kind : {MovingAverageKind::Simple, MovingAverageKind::Exponential}) {
        auto bands = compute_bands(series_from_closes(std::vector<double>(30, 100.0)),
                                   params(20, {1, 2, 3}, kind));
        for (std::size_t i = 19; i < bands.size(); ++i) {
            ASSERT_TRUE(bands[i].has_value()) << "bar " << i;
            EXPECT_DOUBLE_EQ(bands[i]->basis, 100.0);
            EXPECT_DOUBLE_EQ(bands[i]->stddev, 0.0);
            ASSERT_EQ(bands[i]->lines.size(), 3u);
            for (const auto& line : bands[i]->lines) {
                EXPECT_DOUBLE_EQ(line.upper, 100.0) << "k=" << line.multiplier;
                EXPECT_DOUBLE_EQ(line.lower, 100.0) << "k=" << line.multiplier;
            }
        }
    }
}

TEST(BandCalculator, ConstantWindowAfterMovementHasZeroDeviation)
{
    std::vector<double> closes{5.0, 1.0, 9.0, 3.0};
    closes.insert(closes.end(), 12, 0.1);
    auto bands = compute_bands(series_from_closes(closes), params(4, {1, 2, 3}));

    for (std::size_t i = 7; i < bands.size(); ++i) {
        EXPECT_EQ(bands[i]->stddev, 0.0) << "bar " << i;
        for (const auto& line : bands[i]->lines) {
            EXPECT_EQ(line.upper, line.lower) << "bar " << i;
        }
    }
}

TEST(BandCalculator, ExponentialBasisSeededWithSimpleMean)
{
    auto bands = compute_bands(series_from_closes({1, 2, 3, 4, 5}),
                               params(3, {1}, MovingAverageKind::Exponential));

    // alpha = 2 / (3 + 1)
    EXPECT_NEAR(bands[2]->basis, 2.0, kEps);
    EXPECT_NEAR(bands[3]->basis, 3.0, kEps);
    EXPECT_NEAR(bands[4]->basis, 4.0, kEps);
    EXPECT_NEAR(bands[3]->stddev, 1.0, kEps);
}

TEST(BandCalculator, MultipliersKeepRequestOrder)
{
    auto bands = compute_bands(series_from_closes({1, 2, 3}), params(2, {3, 1}));
    ASSERT_EQ(bands[1]->lines.size(), 2u);
    EXPECT_EQ(bands[1]->lines[0].multiplier, 3);
    EXPECT_EQ(bands[1]->lines[1].multiplier, 1);
}

TEST(BandCalculator, RejectsInvalidParameters)
{
    const auto series = series_from_closes({1, 2, 3, 4});
    EXPECT_THROW(compute_bands(series, params(1, {2})), std::invalid_argument);
    EXPECT_THROW(compute_bands(series, params(3, {})), std::invalid_argument);
    EXPECT_THROW(compute_bands(series, params(3, {0})), std::invalid_argument);
    EXPECT_THROW(compute_bands(series, params(3, {-1})), std::invalid_argument);
    EXPECT_THROW(compute_bands(series, params(3, {2, 2})), std::invalid_argument);
}
