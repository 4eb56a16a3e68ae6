#include "lcmerge/merge/MultiBandUpperLimitMerger.hh"
#include "lcmerge/core/Errors.hh"
#include "lcmerge/merge/BinAggregator.hh"
#include "lcmerge/merge/BinClassifier.hh"
#include "lcmerge/stats/BayesianRateEstimator.hh"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>

namespace lcmerge::merge {

UpperLimitMergeResult MergeUpperLimits(const MultiBandTable& table, const RowSelection& sel,
                                       const UpperLimitMergeOptions& opts) {
  const double conf = NormaliseConfidence(opts.conf, "conf");
  const double det_thresh = opts.det_thresh ? NormaliseConfidence(*opts.det_thresh, "detThresh")
                                            : conf;

  sel.Validate(table.size(), "MergeUpperLimits");

  UpperLimitMergeResult out;
  for (std::size_t r : sel.rows()) {
    out.source_exposure += table[r].source_exposure;
    out.image_exposure  += table[r].image_exposure;
  }

  constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

  for (Band band : opts.bands) {
    if (!BandPresent(table, sel, band)) {
      if (opts.verbosity > 0)
        std::cout << "[ulmerge] Skipping band `" << BandName(band) << "` as data are missing\n";
      continue;
    }

    const CountTotals t = AggregateBand(table, sel, band);

    BandMergeResult br;
    br.counts            = t.counts;
    br.bg_counts         = t.background;
    br.correction_factor = t.correction_factor;
    br.exposure          = t.exposure;

    const std::string where = "MergeUpperLimits[band " + BandName(band) + ", rows " + sel.ToString() + "]";
    try {
      std::optional<double> ul;
      if (opts.detections_as_rates) {
        const auto iv = stats::BayesRate(t.counts, t.background, det_thresh);
        if (det_thresh == conf) ul = CountsToRate(iv.s_max, t);

        BandRate rate{kNaN, kNaN, kNaN, false};
        if (iv.s_min > 0.0) {
          const DetectionMeasurement d = RateWithErrors(t);
          rate.rate        = d.rate;
          rate.rate_pos    = d.rate_pos;
          rate.rate_neg    = d.rate_neg;
          rate.is_detected = true;
        }
        if (opts.verbosity > 0) {
          std::cout << "[ulmerge] Band " << BandName(band)
                    << (rate.is_detected ? ": merge gives a detection\n" : ": no detection\n");
        }
        br.rate = rate;
      }

      br.upper_limit = ul ? *ul : UpperLimitRate(t, conf);
    } catch (const NumericalError& e) {
      throw NumericalError(where + ": " + e.what());
    } catch (const InvalidArgument& e) {
      throw InvalidArgument(where + ": " + e.what());
    }
    out.bands.emplace(band, br);
  }
  return out;
}

} // namespace lcmerge::merge
