#pragma once
#include <cstdint>

#include "lcmerge/lightcurve/Dataset.hh"
#include "lcmerge/lightcurve/RowSelection.hh"
#include "lcmerge/lightcurve/UpperLimitTable.hh"

namespace lcmerge::merge {

/// Raw countable totals over a set of rows.
struct CountTotals {
  std::int64_t counts            = 0;    ///< exact sum of source-region counts
  double       background        = 0.0;  ///< sum of expected BG counts
  double       exposure          = 0.0;  ///< sum of exposures [s]
  double       correction_factor = 1.0;  ///< exposure-weighted mean CF
};

/// Totals plus the merged time span and background summary of light-curve bins.
struct BinAggregate {
  CountTotals totals;

  double time     = 0.0;  ///< mean of the selected bin times
  double time_pos = 0.0;
  double time_neg = 0.0;
  double frac_exp = 0.0;  ///< total exposure / merged duration

  double bg_rate = 0.0;   ///< exposure-weighted
  double bg_err  = 0.0;   ///< quadrature, exposure-weighted
};

/**
 * Sum the selected bins of a dataset. The selection is validated against
 * the dataset (InvalidArgument / ConsistencyError); a selected bin with
 * negative counts or background, or non-positive exposure or correction
 * factor, is an InvalidArgument.
 */
BinAggregate AggregateBins(const Dataset& ds, const RowSelection& sel);

/// Sum one band of the selected rows. Every selected row must carry the
/// band (ConsistencyError otherwise).
CountTotals AggregateBand(const MultiBandTable& table, const RowSelection& sel, Band band);

/// True if every selected row carries the band. Assumes a validated selection.
bool BandPresent(const MultiBandTable& table, const RowSelection& sel, Band band);

} // namespace lcmerge::merge
