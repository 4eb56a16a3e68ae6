#pragma once
#include <cstddef>
#include <vector>

#include "lcmerge/lightcurve/Bin.hh"

namespace lcmerge {

/**
 * Time-ascending sequence of bins of a single, fixed Kind.
 *
 * Every mutation checks bin shape against kind() and throws
 * ConsistencyError on a mismatch, leaving the dataset untouched.
 */
class Dataset {
public:
  explicit Dataset(Kind kind) : kind_(kind) {}
  /// Bins are validated and stably sorted by time.
  Dataset(Kind kind, std::vector<Bin> bins);

  Kind kind() const noexcept { return kind_; }
  std::size_t size() const noexcept { return bins_.size(); }
  bool empty() const noexcept { return bins_.empty(); }

  const Bin& operator[](std::size_t i) const { return bins_[i]; }
  const Bin& at(std::size_t i) const;
  const std::vector<Bin>& bins() const noexcept { return bins_; }

  /// Insert at the time-ordered position (after any bins with equal time).
  void Insert(Bin bin);

  /// Replace the full content; all-or-nothing.
  void Replace(std::vector<Bin> bins);

  /// Throws ConsistencyError if bin's measurement shape does not fit kind().
  void CheckShape(const Bin& bin) const;

private:
  Kind             kind_;
  std::vector<Bin> bins_;
};

} // namespace lcmerge
