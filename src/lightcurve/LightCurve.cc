#include "lcmerge/lightcurve/LightCurve.hh"
#include "lcmerge/core/Errors.hh"

#include <utility>

namespace lcmerge {

Dataset& LightCurve::Add(const std::string& name, Dataset ds) {
  auto res = datasets_.emplace(name, std::move(ds));
  if (!res.second)
    throw ConsistencyError("LightCurve: dataset \"" + name + "\" already present");
  return res.first->second;
}

Dataset& LightCurve::dataset(const std::string& name) {
  auto it = datasets_.find(name);
  if (it == datasets_.end())
    throw ConsistencyError("LightCurve: no dataset named \"" + name + "\"");
  return it->second;
}

const Dataset& LightCurve::dataset(const std::string& name) const {
  auto it = datasets_.find(name);
  if (it == datasets_.end())
    throw ConsistencyError("LightCurve: no dataset named \"" + name + "\"");
  return it->second;
}

std::vector<std::string> LightCurve::names() const {
  std::vector<std::string> out;
  out.reserve(datasets_.size());
  for (const auto& kv : datasets_) out.push_back(kv.first);
  return out;
}

} // namespace lcmerge
