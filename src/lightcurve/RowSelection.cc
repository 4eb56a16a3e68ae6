#include "lcmerge/lightcurve/RowSelection.hh"
#include "lcmerge/core/Errors.hh"

#include <algorithm>
#include <numeric>
#include <sstream>

namespace lcmerge {

RowSelection RowSelection::All(std::size_t n) {
  std::vector<std::size_t> rows(n);
  std::iota(rows.begin(), rows.end(), std::size_t{0});
  return RowSelection(std::move(rows));
}

bool RowSelection::contains(std::size_t row) const {
  return std::find(rows_.begin(), rows_.end(), row) != rows_.end();
}

void RowSelection::Validate(std::size_t table_size, const std::string& where) const {
  if (rows_.empty())
    throw InvalidArgument(where + ": row selection is empty");

  for (std::size_t r : rows_) {
    if (r >= table_size) {
      std::ostringstream os;
      os << where << ": selected row " << r << " is not in the table (" << table_size
         << " rows), selection " << ToString();
      throw ConsistencyError(os.str());
    }
  }

  std::vector<std::size_t> sorted = rows_;
  std::sort(sorted.begin(), sorted.end());
  auto dup = std::adjacent_find(sorted.begin(), sorted.end());
  if (dup != sorted.end()) {
    std::ostringstream os;
    os << where << ": row " << *dup << " selected more than once in " << ToString();
    throw InvalidArgument(os.str());
  }
}

std::string RowSelection::ToString() const {
  std::ostringstream os;
  os << '{';
  for (std::size_t i = 0; i < rows_.size(); ++i) os << rows_[i] << (i + 1 < rows_.size() ? "," : "");
  os << '}';
  return os.str();
}

} // namespace lcmerge
