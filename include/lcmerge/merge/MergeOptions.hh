#pragma once

#include <optional>
#include <string>

namespace lcmerge::merge {

/// What to do with a merged bin once it is computed.
enum class InsertPolicy {
  AlwaysCoerce,     ///< insert; bin kind is forced to the dataset kind
  InsertIfMatches,  ///< insert only if the natural kind equals the dataset kind
  NeverInsert       ///< return only
};

std::string InsertPolicyName(InsertPolicy p);
/// "always"/"coerce"/"true", "match", "never"/"false" (case-insensitive).
InsertPolicy ParseInsertPolicy(const std::string& s);

/// Confidence for a 1-sigma (Gaussian-equivalent) rate error.
constexpr double kOneSigmaConf = 0.6827;
/// Default limit confidence, ~3 sigma.
constexpr double kDefaultULConf = 0.997;

/**
 * Accepts a probability in (0,1) or a percentage in (1,100) and returns the
 * probability. Anything else throws InvalidArgument naming `param`.
 */
double NormaliseConfidence(double value, const std::string& param);

struct LightCurveMergeOptions {
  bool         remove     = false;
  InsertPolicy insert     = InsertPolicy::NeverInsert;
  bool         force_rate = false;
  bool         force_ul   = false;
  double       ul_conf    = kDefaultULConf;
  std::optional<double> det_thresh;  ///< defaults to ul_conf
  int          verbosity  = 0;       ///< 0=silent, 1=summary, 2+=debug
};

} // namespace lcmerge::merge
