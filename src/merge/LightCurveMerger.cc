#include "lcmerge/merge/LightCurveMerger.hh"
#include "lcmerge/core/Errors.hh"
#include "lcmerge/merge/BinAggregator.hh"
#include "lcmerge/merge/BinClassifier.hh"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace lcmerge::merge {

namespace {

Bin make_row(const BinAggregate& agg, const Classification& cls) {
  Bin b;
  b.time     = agg.time;
  b.time_pos = agg.time_pos;
  b.time_neg = agg.time_neg;

  b.counts_in_source  = agg.totals.counts;
  b.background_counts = agg.totals.background;
  b.correction_factor = agg.totals.correction_factor;
  b.exposure          = agg.totals.exposure;

  b.frac_exp = agg.frac_exp;
  b.bg_rate  = agg.bg_rate;
  b.bg_err   = agg.bg_err;
  b.snr      = cls.snr;
  // sigma needs source/background region areas, which bins do not carry
  b.measurement = cls.measurement;
  return b;
}

// Re-raise classifier failures with the dataset and rows they came from.
Classification classify(const CountTotals& t, const ClassifierOptions& copt,
                        const std::string& where) {
  try {
    return ClassifyBin(t, copt);
  } catch (const NumericalError& e) {
    throw NumericalError(where + ": " + e.what());
  } catch (const InvalidArgument& e) {
    throw InvalidArgument(where + ": " + e.what());
  }
}

} // namespace

MergeResult MergeLightCurveBins(Dataset& ds, const RowSelection& sel,
                                const LightCurveMergeOptions& opts) {
  if (opts.force_rate && opts.force_ul)
    throw InvalidArgument("MergeLightCurveBins: can't force an upper limit and a rate");

  const double ul_conf = NormaliseConfidence(opts.ul_conf, "ulConf");
  const double det_thresh = opts.det_thresh ? NormaliseConfidence(*opts.det_thresh, "detThresh")
                                            : ul_conf;

  const BinAggregate agg = AggregateBins(ds, sel);

  ClassifierOptions copt;
  copt.det_thresh = det_thresh;
  copt.ul_conf    = ul_conf;
  copt.force_rate = opts.force_rate;
  copt.force_ul   = opts.force_ul;

  if (opts.insert == InsertPolicy::AlwaysCoerce) {
    if (opts.verbosity > 0 && (opts.force_rate || opts.force_ul)) {
      std::cerr << "[merge] WARNING: ignoring `" << (opts.force_rate ? "forceRate" : "forceUL")
                << "` as insert=" << InsertPolicyName(opts.insert) << "\n";
    }
    copt.force_ul   = (ds.kind() == Kind::UpperLimit);
    copt.force_rate = !copt.force_ul;
  } else if (opts.verbosity > 1 && !opts.force_rate && !opts.force_ul) {
    std::cout << "[merge] Checking whether the new bin is a detection (detThresh=" << det_thresh << ")\n";
  }

  const Classification cls = classify(
      agg.totals, copt,
      "MergeLightCurveBins[" + KindName(ds.kind()) + " dataset, rows " + sel.ToString() + "]");

  MergeResult res;
  res.is_upper_limit = cls.is_upper_limit;
  res.merged_row     = make_row(agg, cls);

  if (opts.verbosity > 0) {
    std::cout << "[merge] rows " << sel.ToString() << " -> "
              << (res.is_upper_limit ? "upper limit" : "detection")
              << " (N=" << agg.totals.counts << ", B=" << agg.totals.background
              << ", E=" << agg.totals.exposure << " s)\n";
  }

  const bool insert =
      opts.insert == InsertPolicy::AlwaysCoerce ||
      (opts.insert == InsertPolicy::InsertIfMatches && res.merged_row.kind() == ds.kind());

  if (!opts.remove && !insert) return res;

  std::vector<bool> selected(ds.size(), false);
  for (std::size_t r : sel.rows()) selected[r] = true;

  std::vector<Bin> next;
  next.reserve(ds.size() + 1);
  for (std::size_t i = 0; i < ds.size(); ++i) {
    if (opts.remove && selected[i]) continue;
    next.push_back(ds[i]);
  }
  if (insert) next.push_back(res.merged_row);

  ds.Replace(std::move(next));
  res.was_inserted = insert;

  if (opts.verbosity > 0) {
    std::cout << "[merge] " << (opts.remove ? "removed " : "kept ") << sel.size() << " bin(s)"
              << (insert ? ", inserted merged bin" : "") << "; dataset now has "
              << ds.size() << " bins\n";
  }
  return res;
}

MergeResult MergeLightCurveBins(LightCurve& lc, const std::string& dataset,
                                const RowSelection& sel,
                                const LightCurveMergeOptions& opts) {
  return MergeLightCurveBins(lc.dataset(dataset), sel, opts);
}

} // namespace lcmerge::merge
