#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "lcmerge/lightcurve/RowSelection.hh"
#include "lcmerge/lightcurve/UpperLimitTable.hh"
#include "lcmerge/merge/MergeOptions.hh"

namespace lcmerge::merge {

struct UpperLimitMergeOptions {
  bool              detections_as_rates = true;
  std::vector<Band> bands{kAllBands.begin(), kAllBands.end()};
  double            conf = kDefaultULConf;
  std::optional<double> det_thresh;  ///< defaults to conf
  int               verbosity = 0;
};

/// Rate block of a band; NaN rates when the band is not detected.
struct BandRate {
  double rate        = 0.0;
  double rate_pos    = 0.0;
  double rate_neg    = 0.0;
  bool   is_detected = false;
};

struct BandMergeResult {
  double       upper_limit       = 0.0;
  std::int64_t counts            = 0;
  double       bg_counts         = 0.0;
  double       correction_factor = 1.0;
  double       exposure          = 0.0;
  std::optional<BandRate> rate;  ///< present iff detections_as_rates
};

struct UpperLimitMergeResult {
  double source_exposure = 0.0;
  double image_exposure  = 0.0;
  std::map<Band, BandMergeResult> bands;  ///< only bands that were processed
};

/**
 * Merge the selected rows of a catalogue upper-limit table, one band at a
 * time. A requested band that some selected row does not carry is skipped.
 * The upper limit is always reported; with detections_as_rates the band is
 * also tested for detection at det_thresh and, if detected, given a rate
 * with 1-sigma errors.
 */
UpperLimitMergeResult MergeUpperLimits(const MultiBandTable& table, const RowSelection& sel,
                                       const UpperLimitMergeOptions& opts = {});

} // namespace lcmerge::merge
