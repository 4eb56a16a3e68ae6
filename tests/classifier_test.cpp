#include "lcmerge/core/Errors.hh"
#include "lcmerge/merge/BinClassifier.hh"
#include "lcmerge/stats/BayesianRateEstimator.hh"

#include <gtest/gtest.h>

#include <variant>

using namespace lcmerge;
using namespace lcmerge::merge;

namespace {

CountTotals Totals(std::int64_t N, double B, double E = 1000.0, double cf = 1.0) {
    CountTotals t;
    t.counts = N;
    t.background = B;
    t.exposure = E;
    t.correction_factor = cf;
    return t;
}

ClassifierOptions Opts(double det_thresh, double ul_conf = kDefaultULConf) {
    ClassifierOptions o;
    o.det_thresh = det_thresh;
    o.ul_conf = ul_conf;
    return o;
}

} // namespace

TEST(BinClassifierTest, NonDetectionGivesUpperLimit) {
    auto c = ClassifyBin(Totals(10, 8.0), Opts(0.9973));
    ASSERT_TRUE(c.is_upper_limit);
    const auto& ul = std::get<UpperLimitMeasurement>(c.measurement);
    EXPECT_GT(ul.upper_limit, 0.0);
    EXPECT_EQ(c.snr, 0.0);

    Bin b;
    b.measurement = c.measurement;
    EXPECT_EQ(b.rate_pos(), 0.0);
    EXPECT_EQ(b.rate_neg(), 0.0);
}

TEST(BinClassifierTest, StrongSignalGivesDetection) {
    auto c = ClassifyBin(Totals(200, 5.0), Opts(0.9973));
    ASSERT_FALSE(c.is_upper_limit);
    const auto& d = std::get<DetectionMeasurement>(c.measurement);
    EXPECT_GT(d.rate_pos, 0.0);
    EXPECT_LT(d.rate_neg, 0.0);
    EXPECT_GT(c.snr, 0.0);
}

TEST(BinClassifierTest, RatesScaleWithCorrectionAndExposure) {
    const auto t = Totals(200, 5.0, 400.0, 1.25);
    auto c = ClassifyBin(t, Opts(0.9973));
    const auto& d = std::get<DetectionMeasurement>(c.measurement);

    auto iv = stats::BayesRate(std::int64_t{ 200 }, 5.0, kOneSigmaConf);
    EXPECT_NEAR(d.rate, iv.s_mean * 1.25 / 400.0, 1e-12);
    EXPECT_NEAR(d.rate_pos, (iv.s_max - iv.s_mean) * 1.25 / 400.0, 1e-12);
    EXPECT_NEAR(d.rate_neg, (iv.s_min - iv.s_mean) * 1.25 / 400.0, 1e-12);
}

TEST(BinClassifierTest, UpperLimitUsesULConfidence) {
    const auto t = Totals(4, 3.0, 250.0, 1.5);
    auto c = ClassifyBin(t, Opts(0.9973, 0.9));
    ASSERT_TRUE(c.is_upper_limit);
    auto iv = stats::BayesRate(std::int64_t{ 4 }, 3.0, 0.9);
    EXPECT_NEAR(std::get<UpperLimitMeasurement>(c.measurement).upper_limit, iv.s_max * 1.5 / 250.0, 1e-12);
}

TEST(BinClassifierTest, ForceFlagsOverrideSignificance) {
    auto o = Opts(0.9973);
    o.force_ul = true;
    EXPECT_TRUE(ClassifyBin(Totals(200, 5.0), o).is_upper_limit);

    o.force_ul = false;
    o.force_rate = true;
    auto c = ClassifyBin(Totals(10, 8.0), o);
    EXPECT_FALSE(c.is_upper_limit);
    EXPECT_TRUE(std::holds_alternative<DetectionMeasurement>(c.measurement));
}

TEST(BinClassifierTest, RejectsConflictingOrBadOptions) {
    auto o = Opts(0.9973);
    o.force_rate = true;
    o.force_ul = true;
    EXPECT_THROW(ClassifyBin(Totals(10, 1.0), o), InvalidArgument);
    EXPECT_THROW(ClassifyBin(Totals(10, 1.0), Opts(1.5)), InvalidArgument);
    EXPECT_THROW(ClassifyBin(Totals(10, 1.0), Opts(0.9, 0.0)), InvalidArgument);
    EXPECT_THROW(ClassifyBin(Totals(10, 1.0, 0.0), Opts(0.9)), InvalidArgument);
}

TEST(BinClassifierTest, IsDetectedAgreesWithClassification) {
    EXPECT_FALSE(IsDetected(Totals(10, 8.0), 0.9973));
    EXPECT_TRUE(IsDetected(Totals(200, 5.0), 0.9973));
}
