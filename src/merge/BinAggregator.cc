#include "lcmerge/merge/BinAggregator.hh"
#include "lcmerge/core/Errors.hh"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

namespace lcmerge::merge {

namespace {

// Sums the countable quantities; CF is weighted by exposure.
class CountAccumulator {
public:
  explicit CountAccumulator(std::string where) : where_(std::move(where)) {}

  void Add(std::size_t row, std::int64_t counts, double bg, double cf, double exposure) {
    if (counts < 0 || !(bg >= 0.0) || !std::isfinite(bg) || !(cf > 0.0) || !(exposure > 0.0)) {
      std::ostringstream os;
      os << where_ << ": row " << row << " has invalid counts=" << counts << ", bg=" << bg
         << ", cf=" << cf << ", exposure=" << exposure;
      throw InvalidArgument(os.str());
    }
    if (counts > std::numeric_limits<std::int64_t>::max() - counts_) {
      std::ostringstream os;
      os << where_ << ": summed counts overflow at row " << row << " (running total " << counts_
         << ", adding " << counts << ")";
      throw InvalidArgument(os.str());
    }
    counts_   += counts;
    bg_       += bg;
    exposure_ += exposure;
    cfe_      += cf * exposure;
  }

  CountTotals Totals() const {
    CountTotals t;
    t.counts            = counts_;
    t.background        = bg_;
    t.exposure          = exposure_;
    t.correction_factor = cfe_ / exposure_;
    return t;
  }

private:
  std::string  where_;
  std::int64_t counts_   = 0;
  double       bg_       = 0.0;
  double       exposure_ = 0.0;
  double       cfe_      = 0.0;
};

} // namespace

BinAggregate AggregateBins(const Dataset& ds, const RowSelection& sel) {
  const std::string where = "AggregateBins[" + KindName(ds.kind()) + " dataset, rows " + sel.ToString() + "]";
  sel.Validate(ds.size(), where);

  CountAccumulator acc(where);
  double t_sum = 0.0;
  double start = std::numeric_limits<double>::infinity();
  double stop  = -std::numeric_limits<double>::infinity();
  double bge   = 0.0;
  double bgerr2e = 0.0;

  for (std::size_t r : sel.rows()) {
    const Bin& b = ds[r];
    acc.Add(r, b.counts_in_source, b.background_counts, b.correction_factor, b.exposure);
    t_sum += b.time;
    start = std::min(start, b.start());
    stop  = std::max(stop, b.stop());
    bge     += b.bg_rate * b.exposure;
    bgerr2e += b.bg_err * b.bg_err * b.exposure;
  }

  BinAggregate agg;
  agg.totals = acc.Totals();

  const double E = agg.totals.exposure;
  const double centre = std::clamp(t_sum / static_cast<double>(sel.size()), start, stop);
  agg.time     = centre;
  agg.time_pos = stop - centre;
  agg.time_neg = centre - start;

  const double duration = stop - start;
  agg.frac_exp = duration > 0.0 ? E / duration : std::numeric_limits<double>::quiet_NaN();
  agg.bg_rate  = bge / E;
  agg.bg_err   = std::sqrt(bgerr2e) / E;
  return agg;
}

bool BandPresent(const MultiBandTable& table, const RowSelection& sel, Band band) {
  return std::all_of(sel.rows().begin(), sel.rows().end(),
                     [&](std::size_t r) { return table[r].band(band).has_value(); });
}

CountTotals AggregateBand(const MultiBandTable& table, const RowSelection& sel, Band band) {
  const std::string where = "AggregateBand[" + BandName(band) + ", rows " + sel.ToString() + "]";
  sel.Validate(table.size(), where);

  CountAccumulator acc(where);
  for (std::size_t r : sel.rows()) {
    const auto& cols = table[r].band(band);
    if (!cols) {
      std::ostringstream os;
      os << where << ": row " << r << " has no " << BandName(band) << " band data";
      throw ConsistencyError(os.str());
    }
    acc.Add(r, cols->counts, cols->bg_counts, cols->correction_factor, cols->exposure);
  }
  return acc.Totals();
}

} // namespace lcmerge::merge
