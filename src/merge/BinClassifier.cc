#include "lcmerge/merge/BinClassifier.hh"
#include "lcmerge/core/Errors.hh"
#include "lcmerge/stats/BayesianRateEstimator.hh"

#include <cmath>

namespace lcmerge::merge {

double CountsToRate(double s, const CountTotals& t) {
  return s * t.correction_factor / t.exposure;
}

DetectionMeasurement RateWithErrors(const CountTotals& t) {
  const auto iv = stats::BayesRate(t.counts, t.background, kOneSigmaConf);
  DetectionMeasurement d;
  d.rate     = CountsToRate(iv.s_mean, t);
  d.rate_pos = CountsToRate(iv.s_max - iv.s_mean, t);
  d.rate_neg = CountsToRate(iv.s_min - iv.s_mean, t);
  return d;
}

double UpperLimitRate(const CountTotals& t, double conf) {
  return CountsToRate(stats::BayesRate(t.counts, t.background, conf).s_max, t);
}

bool IsDetected(const CountTotals& t, double det_thresh) {
  return stats::BayesRate(t.counts, t.background, det_thresh).s_min > 0.0;
}

Classification ClassifyBin(const CountTotals& t, const ClassifierOptions& opts) {
  if (opts.force_rate && opts.force_ul)
    throw InvalidArgument("ClassifyBin: forceRate and forceUL are mutually exclusive");
  if (!(opts.det_thresh > 0.0 && opts.det_thresh < 1.0))
    throw InvalidArgument("ClassifyBin: detThresh must lie in (0,1)");
  if (!(opts.ul_conf > 0.0 && opts.ul_conf < 1.0))
    throw InvalidArgument("ClassifyBin: ulConf must lie in (0,1)");
  if (!(t.exposure > 0.0))
    throw InvalidArgument("ClassifyBin: exposure must be > 0");

  Classification c;
  double ul_from_test = std::nan("");

  if (opts.force_ul) {
    c.is_upper_limit = true;
  } else if (opts.force_rate) {
    c.is_upper_limit = false;
  } else {
    const auto iv = stats::BayesRate(t.counts, t.background, opts.det_thresh);
    c.is_upper_limit = !(iv.s_min > 0.0);
    if (opts.det_thresh == opts.ul_conf) ul_from_test = CountsToRate(iv.s_max, t);
  }

  if (c.is_upper_limit) {
    UpperLimitMeasurement ul;
    ul.upper_limit = std::isnan(ul_from_test) ? UpperLimitRate(t, opts.ul_conf) : ul_from_test;
    c.measurement = ul;
    c.snr = 0.0;
  } else {
    const DetectionMeasurement d = RateWithErrors(t);
    c.measurement = d;
    c.snr = d.rate_neg < 0.0 ? d.rate / std::fabs(d.rate_neg) : 0.0;
  }
  return c;
}

} // namespace lcmerge::merge
