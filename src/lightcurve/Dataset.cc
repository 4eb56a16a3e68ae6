#include "lcmerge/lightcurve/Dataset.hh"
#include "lcmerge/core/Errors.hh"

#include <algorithm>
#include <sstream>
#include <utility>

namespace lcmerge {

namespace {

bool by_time(const Bin& a, const Bin& b) { return a.time < b.time; }

} // namespace

Dataset::Dataset(Kind kind, std::vector<Bin> bins) : kind_(kind) {
  Replace(std::move(bins));
}

const Bin& Dataset::at(std::size_t i) const {
  if (i >= bins_.size()) {
    std::ostringstream os;
    os << "Dataset::at: row " << i << " out of range (" << bins_.size() << " rows)";
    throw ConsistencyError(os.str());
  }
  return bins_[i];
}

void Dataset::CheckShape(const Bin& bin) const {
  if (bin.kind() != kind_) {
    std::ostringstream os;
    os << "Dataset: cannot hold a " << KindName(bin.kind()) << " bin (t=" << bin.time
       << ") in a " << KindName(kind_) << " dataset";
    throw ConsistencyError(os.str());
  }
}

void Dataset::Insert(Bin bin) {
  CheckShape(bin);
  auto pos = std::upper_bound(bins_.begin(), bins_.end(), bin, by_time);
  bins_.insert(pos, std::move(bin));
}

void Dataset::Replace(std::vector<Bin> bins) {
  for (const auto& b : bins) CheckShape(b);
  std::stable_sort(bins.begin(), bins.end(), by_time);
  bins_.swap(bins);
}

} // namespace lcmerge
