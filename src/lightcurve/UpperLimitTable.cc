#include "lcmerge/lightcurve/UpperLimitTable.hh"
#include "lcmerge/core/Errors.hh"
#include "lcmerge/core/Strings.hh"

#include <algorithm>


namespace lcmerge {

std::string BandName(Band b) {
  switch (b) {
    case Band::Total:  return "Total";
    case Band::Soft:   return "Soft";
    case Band::Medium: return "Medium";
    case Band::Hard:   return "Hard";
  }
  return "Unknown";
}

Band ParseBand(const std::string& s) {
  const std::string name = ToLower(s);
  for (Band b : kAllBands) {
    if (ToLower(BandName(b)) == name) return b;
  }
  throw InvalidArgument("band \"" + s + "\" is not recognised (Total, Soft, Medium, Hard)");
}

std::vector<Band> ParseBands(const std::vector<std::string>& names) {
  if (names.empty() || (names.size() == 1 && ToLower(names.front()) == "all"))
    return std::vector<Band>(kAllBands.begin(), kAllBands.end());

  std::vector<Band> out;
  for (const auto& n : names) {
    const Band b = ParseBand(n);
    if (std::find(out.begin(), out.end(), b) == out.end()) out.push_back(b);
  }
  return out;
}

} // namespace lcmerge
