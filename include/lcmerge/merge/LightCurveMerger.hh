#pragma once
#include <string>

#include "lcmerge/lightcurve/Bin.hh"
#include "lcmerge/lightcurve/Dataset.hh"
#include "lcmerge/lightcurve/LightCurve.hh"
#include "lcmerge/lightcurve/RowSelection.hh"
#include "lcmerge/merge/MergeOptions.hh"

namespace lcmerge::merge {

struct MergeResult {
  bool is_upper_limit = false;
  bool was_inserted   = false;
  Bin  merged_row;  ///< carries the provenance totals used to build it
};

/**
 * Merge a subset of bins of one dataset into a single bin.
 *
 * The bins are aggregated, then classified as a detection (rate with
 * 1-sigma errors) or an upper limit at opts.ul_conf. With
 * InsertPolicy::AlwaysCoerce the classification is forced to the dataset
 * kind and the caller's force flags are ignored. With opts.remove the
 * selected bins are removed; the insert policy decides whether the new bin
 * is added at its time-ordered position.
 *
 * The dataset is modified only once every step has succeeded; on any
 * exception it is left as it was.
 */
MergeResult MergeLightCurveBins(Dataset& ds, const RowSelection& sel,
                                const LightCurveMergeOptions& opts = {});

/// Same, addressing the dataset by name (ConsistencyError if unknown).
MergeResult MergeLightCurveBins(LightCurve& lc, const std::string& dataset,
                                const RowSelection& sel,
                                const LightCurveMergeOptions& opts = {});

} // namespace lcmerge::merge
