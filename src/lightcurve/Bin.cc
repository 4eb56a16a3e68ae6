#include "lcmerge/lightcurve/Bin.hh"
#include "lcmerge/core/Errors.hh"
#include "lcmerge/core/Strings.hh"


namespace lcmerge {

std::string KindName(Kind k) {
  switch (k) {
    case Kind::Detection:  return "detection";
    case Kind::UpperLimit: return "upper_limit";
  }
  return "unknown";
}

Kind ParseKind(const std::string& s) {
  const std::string name = ToLower(s);
  if (name == "detection" || name == "rate")
    return Kind::Detection;
  if (name == "upper_limit" || name == "upperlimit" || name == "ul")
    return Kind::UpperLimit;
  throw InvalidArgument("unknown dataset kind \"" + s + "\" (expected detection/upper_limit)");
}

double Bin::rate_pos() const noexcept {
  if (const auto* d = std::get_if<DetectionMeasurement>(&measurement)) return d->rate_pos;
  return 0.0;
}

double Bin::rate_neg() const noexcept {
  if (const auto* d = std::get_if<DetectionMeasurement>(&measurement)) return d->rate_neg;
  return 0.0;
}

} // namespace lcmerge
