#pragma once
#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace lcmerge {

/// Explicit list of row indices into one table. Order is preserved; the
/// selection is checked against the table it is applied to by Validate().
class RowSelection {
public:
  RowSelection() = default;
  RowSelection(std::initializer_list<std::size_t> rows) : rows_(rows) {}
  explicit RowSelection(std::vector<std::size_t> rows) : rows_(std::move(rows)) {}

  /// Every row of a table with n rows.
  static RowSelection All(std::size_t n);

  const std::vector<std::size_t>& rows() const noexcept { return rows_; }
  std::size_t size() const noexcept { return rows_.size(); }
  bool empty() const noexcept { return rows_.empty(); }
  bool contains(std::size_t row) const;

  /// Throws InvalidArgument if empty or if an index repeats, and
  /// ConsistencyError if an index is >= table_size. `where` names the
  /// caller and table for the message.
  void Validate(std::size_t table_size, const std::string& where) const;

  /// "{0,3,4}"
  std::string ToString() const;

private:
  std::vector<std::size_t> rows_;
};

} // namespace lcmerge
