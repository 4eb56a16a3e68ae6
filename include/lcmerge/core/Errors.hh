#pragma once
#include <stdexcept>
#include <string>

namespace lcmerge {

/// Bad caller input: negative or non-integral counts, confidence outside
/// (0,1), empty selection, conflicting force flags, unknown band name.
class InvalidArgument : public std::invalid_argument {
public:
  explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
};

/// Caller precondition violated on the data itself, e.g. a selected row
/// that is not part of the table, or a bin whose shape does not match the
/// dataset kind.
class ConsistencyError : public std::logic_error {
public:
  explicit ConsistencyError(const std::string& what) : std::logic_error(what) {}
};

/// Root finding failed to bracket, converge, or reach the required
/// probability-mass accuracy.
class NumericalError : public std::runtime_error {
public:
  explicit NumericalError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace lcmerge
