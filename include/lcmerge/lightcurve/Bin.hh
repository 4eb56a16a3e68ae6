#pragma once
#include <cstdint>
#include <limits>
#include <string>
#include <variant>

namespace lcmerge {

/// Which measurement shape the rows of a dataset carry.
enum class Kind { Detection, UpperLimit };

std::string KindName(Kind k);
/// Accepts "detection"/"rate" and "upperlimit"/"ul" (case-insensitive).
Kind ParseKind(const std::string& s);

struct DetectionMeasurement {
  double rate     = 0.0;
  double rate_pos = 0.0;  ///< > 0
  double rate_neg = 0.0;  ///< < 0
};

struct UpperLimitMeasurement {
  double upper_limit = 0.0;  ///< > 0
};

using Measurement = std::variant<DetectionMeasurement, UpperLimitMeasurement>;

/// One time-indexed light-curve row. Times in seconds; TimePos/TimeNeg are
/// non-negative half-widths, so the bin spans [time - time_neg, time + time_pos].
struct Bin {
  double time     = 0.0;
  double time_pos = 0.0;
  double time_neg = 0.0;

  std::int64_t counts_in_source  = 0;
  double       background_counts = 0.0;  ///< expected BG counts in the source region
  double       correction_factor = 1.0;
  double       exposure          = 0.0;  ///< s

  double frac_exp = 1.0;  ///< exposure / bin duration
  double bg_rate  = 0.0;  ///< count/s
  double bg_err   = 0.0;
  double sigma    = std::numeric_limits<double>::quiet_NaN();
  double snr      = 0.0;

  Measurement measurement = UpperLimitMeasurement{};

  Kind kind() const noexcept {
    return std::holds_alternative<DetectionMeasurement>(measurement) ? Kind::Detection
                                                                     : Kind::UpperLimit;
  }
  bool is_upper_limit() const noexcept { return kind() == Kind::UpperLimit; }

  double start() const noexcept { return time - time_neg; }
  double stop()  const noexcept { return time + time_pos; }

  /// 0 for upper limits.
  double rate_pos() const noexcept;
  double rate_neg() const noexcept;
};

} // namespace lcmerge
