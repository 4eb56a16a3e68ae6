#pragma once
#include <map>
#include <string>
#include <vector>

#include "lcmerge/lightcurve/Dataset.hh"

namespace lcmerge {

/// Named datasets of one light curve, e.g. "PC" and "PCUL".
class LightCurve {
public:
  LightCurve() = default;

  /// Throws ConsistencyError if a dataset with this name already exists.
  Dataset& Add(const std::string& name, Dataset ds);

  bool has(const std::string& name) const { return datasets_.count(name) > 0; }

  /// Throws ConsistencyError for an unknown name.
  Dataset&       dataset(const std::string& name);
  const Dataset& dataset(const std::string& name) const;

  std::vector<std::string> names() const;
  std::size_t size() const noexcept { return datasets_.size(); }

private:
  std::map<std::string, Dataset> datasets_;
};

} // namespace lcmerge
