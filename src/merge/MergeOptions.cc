#include "lcmerge/merge/MergeOptions.hh"
#include "lcmerge/core/Errors.hh"
#include "lcmerge/core/Strings.hh"

#include <cmath>
#include <sstream>

namespace lcmerge::merge {

std::string InsertPolicyName(InsertPolicy p) {
  switch (p) {
    case InsertPolicy::AlwaysCoerce:    return "always";
    case InsertPolicy::InsertIfMatches: return "match";
    case InsertPolicy::NeverInsert:     return "never";
  }
  return "unknown";
}

InsertPolicy ParseInsertPolicy(const std::string& s) {
  const std::string name = ToLower(s);
  if (name == "always" || name == "coerce" || name == "true") return InsertPolicy::AlwaysCoerce;
  if (name == "match")                                        return InsertPolicy::InsertIfMatches;
  if (name == "never" || name == "false")                     return InsertPolicy::NeverInsert;
  throw InvalidArgument("insert policy must be always/match/never, got \"" + s + "\"");
}

double NormaliseConfidence(double value, const std::string& param) {
  double c = value;
  if (c > 1.0 && c < 100.0) c /= 100.0;
  if (!(c > 0.0 && c < 1.0)) {
    std::ostringstream os;
    os << "`" << param << "` must be a probability in (0,1) or a percentage, got " << value;
    throw InvalidArgument(os.str());
  }
  return c;
}

} // namespace lcmerge::merge
