#include "lcmerge/core/Errors.hh"
#include "lcmerge/merge/BinAggregator.hh"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>

using lcmerge::Dataset;
using lcmerge::Kind;
using lcmerge::RowSelection;
using lcmerge::merge::AggregateBand;
using lcmerge::merge::AggregateBins;

namespace {

Dataset FourULBins() {
    return Dataset(Kind::UpperLimit, {
        MakeULBin(100.0, 10.0, 3, 0.4, 20.0, 1.1),
        MakeULBin(200.0, 20.0, 1, 0.7, 35.5, 1.3),
        MakeULBin(400.0, 50.0, 4, 1.2, 80.25, 1.05),
        MakeULBin(900.0, 5.0, 0, 0.05, 9.0, 2.0),
    });
}

} // namespace

TEST(BinAggregatorTest, TotalsAreExactSums) {
    Dataset ds = FourULBins();
    auto agg = AggregateBins(ds, RowSelection{ 0, 1, 2 });

    EXPECT_EQ(agg.totals.counts, 8);
    EXPECT_DOUBLE_EQ(agg.totals.exposure, 20.0 + 35.5 + 80.25);
    EXPECT_DOUBLE_EQ(agg.totals.background, 0.4 + 0.7 + 1.2);

    const double cfe = 1.1 * 20.0 + 1.3 * 35.5 + 1.05 * 80.25;
    EXPECT_NEAR(agg.totals.correction_factor, cfe / (20.0 + 35.5 + 80.25), 1e-12);
}

TEST(BinAggregatorTest, MergedTimeSpanCoversSelection) {
    Dataset ds = FourULBins();
    auto agg = AggregateBins(ds, RowSelection{ 1, 2 });

    // span [180, 450], centre at the mean time 300
    EXPECT_DOUBLE_EQ(agg.time, 300.0);
    EXPECT_DOUBLE_EQ(agg.time - agg.time_neg, 180.0);
    EXPECT_DOUBLE_EQ(agg.time + agg.time_pos, 450.0);
    EXPECT_NEAR(agg.frac_exp, (35.5 + 80.25) / 270.0, 1e-12);
}

TEST(BinAggregatorTest, BackgroundRateIsExposureWeighted) {
    Dataset ds = FourULBins();
    auto agg = AggregateBins(ds, RowSelection{ 0, 2 });
    const double E = 20.0 + 80.25;
    const double bg = (ds[0].bg_rate * 20.0 + ds[2].bg_rate * 80.25) / E;
    const double err = std::sqrt(ds[0].bg_err * ds[0].bg_err * 20.0 + ds[2].bg_err * ds[2].bg_err * 80.25) / E;
    EXPECT_NEAR(agg.bg_rate, bg, 1e-12);
    EXPECT_NEAR(agg.bg_err, err, 1e-12);
}

TEST(BinAggregatorTest, SelectionOrderDoesNotMatter) {
    Dataset ds = FourULBins();
    auto a = AggregateBins(ds, RowSelection{ 3, 0, 2 });
    auto b = AggregateBins(ds, RowSelection{ 0, 2, 3 });
    EXPECT_EQ(a.totals.counts, b.totals.counts);
    EXPECT_NEAR(a.totals.exposure, b.totals.exposure, 1e-12);
    EXPECT_NEAR(a.time, b.time, 1e-12);
}

TEST(BinAggregatorTest, RejectsBadSelections) {
    Dataset ds = FourULBins();
    EXPECT_THROW(AggregateBins(ds, RowSelection{}), lcmerge::InvalidArgument);
    EXPECT_THROW(AggregateBins(ds, RowSelection{ 1, 4 }), lcmerge::ConsistencyError);
    EXPECT_THROW(AggregateBins(ds, RowSelection{ 1, 1 }), lcmerge::InvalidArgument);
}

TEST(BinAggregatorTest, RejectsNonPositiveExposure) {
    Dataset ds(Kind::UpperLimit, { MakeULBin(10.0, 1.0, 1, 0.1, 5.0), MakeULBin(20.0, 1.0, 1, 0.1, 0.0) });
    EXPECT_THROW(AggregateBins(ds, RowSelection{ 0, 1 }), lcmerge::InvalidArgument);
}

TEST(BinAggregatorTest, AggregatesOneBand) {
    lcmerge::MultiBandTable table(2);
    table[0].band(lcmerge::Band::Soft) = lcmerge::BandColumns{ 5, 0.5, 1.2, 100.0 };
    table[1].band(lcmerge::Band::Soft) = lcmerge::BandColumns{ 2, 0.25, 1.4, 300.0 };
    table[0].band(lcmerge::Band::Hard) = lcmerge::BandColumns{ 1, 0.1, 1.0, 100.0 };

    auto t = AggregateBand(table, RowSelection{ 0, 1 }, lcmerge::Band::Soft);
    EXPECT_EQ(t.counts, 7);
    EXPECT_DOUBLE_EQ(t.background, 0.75);
    EXPECT_DOUBLE_EQ(t.exposure, 400.0);
    EXPECT_NEAR(t.correction_factor, (1.2 * 100.0 + 1.4 * 300.0) / 400.0, 1e-12);

    EXPECT_TRUE(lcmerge::merge::BandPresent(table, RowSelection{ 0, 1 }, lcmerge::Band::Soft));
    EXPECT_FALSE(lcmerge::merge::BandPresent(table, RowSelection{ 0, 1 }, lcmerge::Band::Hard));
    EXPECT_THROW(AggregateBand(table, RowSelection{ 0, 1 }, lcmerge::Band::Hard), lcmerge::ConsistencyError);
}

TEST(BinAggregatorTest, RejectsCountSumOverflow) {
    const std::int64_t big = std::numeric_limits<std::int64_t>::max() - 1;
    Dataset ds(Kind::UpperLimit, { MakeULBin(10.0, 1.0, big, 0.1, 5.0), MakeULBin(20.0, 1.0, 2, 0.1, 5.0) });
    EXPECT_THROW(AggregateBins(ds, RowSelection{ 0, 1 }), lcmerge::InvalidArgument);

    lcmerge::MultiBandTable table(2);
    table[0].band(lcmerge::Band::Total) = lcmerge::BandColumns{ big, 0.5, 1.0, 100.0 };
    table[1].band(lcmerge::Band::Total) = lcmerge::BandColumns{ big, 0.5, 1.0, 100.0 };
    EXPECT_THROW(AggregateBand(table, RowSelection{ 0, 1 }, lcmerge::Band::Total), lcmerge::InvalidArgument);
}

TEST(BinAggregatorTest, RejectsNonFiniteBackground) {
    Dataset ds(Kind::UpperLimit, { MakeULBin(10.0, 1.0, 1, INFINITY, 5.0), MakeULBin(20.0, 1.0, 1, 0.1, 5.0) });
    EXPECT_THROW(AggregateBins(ds, RowSelection{ 0, 1 }), lcmerge::InvalidArgument);
}
