#pragma once

#include "lcmerge/lightcurve/Bin.hh"
#include "lcmerge/merge/BinAggregator.hh"
#include "lcmerge/merge/MergeOptions.hh"

namespace lcmerge::merge {

struct ClassifierOptions {
  double det_thresh = kDefaultULConf;  ///< confidence at which S_min > 0 means detected
  double ul_conf    = kDefaultULConf;
  bool   force_rate = false;
  bool   force_ul   = false;
};

struct Classification {
  bool        is_upper_limit = true;
  Measurement measurement;
  double      snr = 0.0;  ///< rate / |rate_neg|, 0 for limits
};

/// Source counts S to rate: S * CF / exposure.
double CountsToRate(double s, const CountTotals& t);

/// Rate with 1-sigma errors from the KBN interval at kOneSigmaConf.
DetectionMeasurement RateWithErrors(const CountTotals& t);

/// Upper limit on the rate at confidence `conf`.
double UpperLimitRate(const CountTotals& t, double conf);

/// True if the KBN lower bound at `det_thresh` is above zero.
bool IsDetected(const CountTotals& t, double det_thresh);

/**
 * Decide detection vs. upper limit and build the measurement:
 *   force_ul   -> upper limit
 *   force_rate -> detection
 *   otherwise detected iff S_min(det_thresh) > 0.
 * Both force flags set, or a confidence outside (0,1), is an InvalidArgument.
 */
Classification ClassifyBin(const CountTotals& t, const ClassifierOptions& opts);

} // namespace lcmerge::merge
