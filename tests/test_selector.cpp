// test_selector.cpp - position enumeration, capacity and step policy.

#include <gtest/gtest.h>

#include "capacity.hpp"
#include "coefficient_selector.hpp"
#include "protocol.hpp"
#include "step_policy.hpp"
#include "stego_errors.hpp"
#include "wavelet.hpp"

#include <opencv2/core.hpp>

#include <limits>
#include <utility>
#include <vector>

using namespace dwtstego;

static BandSet twoBands(int rowsA, int colsA, int rowsB, int colsB)
{
    BandSet set;
    set.bands.push_back({"A", cv::Mat::zeros(rowsA, colsA, CV_64F)});
    set.bands.push_back({"B", cv::Mat::zeros(rowsB, colsB, CV_64F)});
    return set;
}

TEST(SelectorTest, WalksBandsInPriorityOrderThenRowMajor)
{
    BandSet set = twoBands(4, 5, 3, 3);
    CoefficientSelector sel(set, {"B", "A"}, 1, 2);

    // B: rows 1..2, cols 2..2 -> 2 positions; A: rows 1..3, cols 2..4 -> 9
    ASSERT_EQ(sel.count(), 11u);

    std::vector<CoefficientPosition> pos = sel.range(0, sel.count());
    EXPECT_EQ(sel.bandName(pos[0]), "B");
    EXPECT_EQ(pos[0].row, 1);
    EXPECT_EQ(pos[0].col, 2);
    EXPECT_EQ(pos[1].row, 2);
    EXPECT_EQ(pos[1].col, 2);

    EXPECT_EQ(sel.bandName(pos[2]), "A");
    EXPECT_EQ(pos[2].row, 1);
    EXPECT_EQ(pos[2].col, 2);
    EXPECT_EQ(pos[3].col, 3);
    EXPECT_EQ(pos[4].col, 4);
    EXPECT_EQ(pos[5].row, 2);
    EXPECT_EQ(pos[5].col, 2);
    EXPECT_EQ(pos[10].row, 3);
    EXPECT_EQ(pos[10].col, 4);
}

TEST(SelectorTest, DependsOnlyOnShapesNotValues)
{
    cv::Mat cover(64, 64, CV_8U);
    cv::RNG rng(7);
    rng.fill(cover, cv::RNG::UNIFORM, 0, 256);
    cv::Mat other(64, 64, CV_8U, cv::Scalar(17));

    StegoProtocol p = StegoProtocol::defaults();
    p.rowSkip = 4;
    p.colSkip = 4;

    BandSet a = HaarWavelet::decompose(cover, 2);
    BandSet b = HaarWavelet::decompose(other, 2);
    CoefficientSelector sa(a, p.bandOrder, p.rowSkip, p.colSkip);
    CoefficientSelector sb(b, p.bandOrder, p.rowSkip, p.colSkip);

    ASSERT_EQ(sa.count(), sb.count());
    EXPECT_EQ(sa.range(0, sa.count()), sb.range(0, sb.count()));

    // restartable: a second pass over the same selector is identical
    EXPECT_EQ(sa.range(0, sa.count()), sa.range(0, sa.count()));
}

TEST(SelectorTest, MarginAtOrPastBandSizeIsRejected)
{
    BandSet set = twoBands(8, 8, 4, 6);
    EXPECT_THROW(CoefficientSelector(set, {"A", "B"}, 4, 0), ConfigurationError);
    EXPECT_THROW(CoefficientSelector(set, {"A", "B"}, 0, 8), ConfigurationError);
    EXPECT_NO_THROW(CoefficientSelector(set, {"A", "B"}, 3, 5));
}

TEST(SelectorTest, BadConfigurationsAreRejected)
{
    BandSet set = twoBands(8, 8, 8, 8);
    EXPECT_THROW(CoefficientSelector(set, {}, 0, 0), ConfigurationError);
    EXPECT_THROW(CoefficientSelector(set, {"A", "C"}, 0, 0), ConfigurationError);
    EXPECT_THROW(CoefficientSelector(set, {"A", "A"}, 0, 0), ConfigurationError);
    EXPECT_THROW(CoefficientSelector(set, {"A"}, -1, 0), ConfigurationError);

    CoefficientSelector sel(set, {"A"}, 0, 0);
    EXPECT_THROW(sel.at(64), ConfigurationError);
    EXPECT_THROW(sel.range(60, 5), ConfigurationError);
}

TEST(CapacityTest, CountsPositionsAndReservesHeader)
{
    BandSet set = twoBands(10, 10, 10, 10);
    CoefficientSelector sel(set, {"A", "B"}, 2, 2);

    EXPECT_EQ(capacityBits(sel), 128u);
    EXPECT_EQ(capacityBytes(sel), 16u);
    EXPECT_EQ(maxPayloadBytes(sel), 12u);
    EXPECT_TRUE(fits(sel, 12));
    EXPECT_FALSE(fits(sel, 13));
}

TEST(CapacityTest, TinySelectorHasNoPayloadRoom)
{
    BandSet set = twoBands(4, 4, 4, 4);
    CoefficientSelector sel(set, {"A"}, 0, 0);
    EXPECT_EQ(maxPayloadBytes(sel), 0u);
}

TEST(CapacityTest, GeometryOnlyEstimateMatchesDecomposedImage)
{
    StegoProtocol p = StegoProtocol::defaults();
    const cv::Size size(256, 256);

    // level 1: 3 * 112 * 112, level 2: 3 * 48 * 48
    const size_t bits = 3u * 112u * 112u + 3u * 48u * 48u;
    EXPECT_EQ(maxPayloadBytes(size, p), (bits - HEADER_BITS) / 8);

    cv::Mat img(size, CV_8U, cv::Scalar(128));
    BandSet bands = HaarWavelet::decompose(img, DWT_LEVELS);
    CoefficientSelector sel(bands, p.bandOrder, p.rowSkip, p.colSkip);
    EXPECT_EQ(maxPayloadBytes(sel), maxPayloadBytes(size, p));
}

TEST(StepPolicyTest, ProtocolTable)
{
    AdaptiveStepPolicy policy = AdaptiveStepPolicy::protocolTable();
    EXPECT_DOUBLE_EQ(policy.stepFor(0), 4.0);
    EXPECT_DOUBLE_EQ(policy.stepFor(5), 4.0);
    EXPECT_DOUBLE_EQ(policy.stepFor(2000), 4.0);
    EXPECT_DOUBLE_EQ(policy.stepFor(2001), 6.0);
    EXPECT_DOUBLE_EQ(policy.stepFor(5000), 6.0);
    EXPECT_DOUBLE_EQ(policy.stepFor(5001), 7.0);
    EXPECT_DOUBLE_EQ(policy.stepFor(std::numeric_limits<uint32_t>::max()), 7.0);
}

TEST(StepPolicyTest, NonDecreasingInPayloadLength)
{
    AdaptiveStepPolicy policy;
    double prev = policy.stepFor(0);
    for (uint32_t len = 1; len < 20000; ++len) {
        const double q = policy.stepFor(len);
        EXPECT_GE(q, prev) << "len=" << len;
        prev = q;
    }
}

static AdaptiveStepPolicy makePolicy(std::vector<StepEntry> table)
{
    return AdaptiveStepPolicy(std::move(table));
}

TEST(StepPolicyTest, LengthsPastLastThresholdUseLastStep)
{
    AdaptiveStepPolicy policy = makePolicy({{10, 2.0}, {20, 3.0}});
    EXPECT_DOUBLE_EQ(policy.stepFor(10), 2.0);
    EXPECT_DOUBLE_EQ(policy.stepFor(11), 3.0);
    EXPECT_DOUBLE_EQ(policy.stepFor(21), 3.0);
}

TEST(StepPolicyTest, InvalidTablesAreRejected)
{
    EXPECT_THROW(makePolicy({}), ConfigurationError);
    EXPECT_THROW(makePolicy({{10, 4.0}, {10, 5.0}}), ConfigurationError);
    EXPECT_THROW(makePolicy({{10, 4.0}, {5, 5.0}}), ConfigurationError);
    EXPECT_THROW(makePolicy({{10, 5.0}, {20, 4.0}}), ConfigurationError);
    EXPECT_THROW(makePolicy({{10, 0.0}}), ConfigurationError);
    EXPECT_THROW(makePolicy({{10, -1.0}}), ConfigurationError);
}
