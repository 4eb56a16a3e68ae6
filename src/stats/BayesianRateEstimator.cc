#include "lcmerge/stats/BayesianRateEstimator.hh"

#include "lcmerge/core/Errors.hh"

#include <Math/BrentRootFinder.h>
#include <Math/Functor.h>
#include <Math/SpecFuncMathCore.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <sstream>
#include <string>

namespace lcmerge::stats {

namespace {

constexpr int    kMaxBrentIter   = 200;
constexpr double kRootAbsTol     = 1e-10;
constexpr double kRootRelTol     = 1e-12;
constexpr int    kMaxBracketGrow = 200;

// Below this the regularized gamma from MathCore has lost all precision.
constexpr double kMinReliableQ = 1e-280;

std::string describe(std::int64_t N, double B, double conf) {
  std::ostringstream os;
  os << "N=" << N << ", B=" << B << ", conf=" << conf;
  return os.str();
}

// log Q(n+1, x), Q the regularized upper incomplete gamma. When Q underflows
// (x >> n) it is summed in log-space from the dominant Poisson term
// e^-x x^n / n! downwards.
double log_upper_gamma(std::int64_t n, double x) {
  if (x <= 0.0) return 0.0;
  const double q = ROOT::Math::inc_gamma_c(static_cast<double>(n + 1), x);
  if (q > kMinReliableQ) return std::log(q);

  const double lx = std::log(x);
  const double lead = -x + n * lx - ROOT::Math::lgamma(static_cast<double>(n + 1));
  double rel = 0.0;  // log(term_k / term_n)
  double sum = 1.0;
  for (std::int64_t k = n; k > 0; --k) {
    rel += std::log(static_cast<double>(k)) - lx;
    if (rel < -40.0) break;
    sum += std::exp(rel);
  }
  return lead + std::log(sum);
}

// Unnormalized log posterior density of S.
double log_density(std::int64_t N, double B, double s) {
  const double mu = s + B;
  if (N == 0) return -mu;
  if (mu <= 0.0) return -std::numeric_limits<double>::infinity();
  return static_cast<double>(N) * std::log(mu) - mu;
}

double solve_bracketed(const std::function<double(double)>& f, double lo, double hi,
                       const char* what, const std::string& ctx) {
  ROOT::Math::Functor1D func(f);
  ROOT::Math::BrentRootFinder brf;
  if (!brf.SetFunction(func, lo, hi)) {
    throw NumericalError(std::string("BayesRate: cannot set up root finder for ") + what + " (" + ctx + ")");
  }
  if (!brf.Solve(kMaxBrentIter, kRootAbsTol, kRootRelTol)) {
    std::ostringstream os;
    os << "BayesRate: " << what << " did not converge in [" << lo << ", " << hi << "] (" << ctx << ")";
    throw NumericalError(os.str());
  }
  return brf.Root();
}

class Posterior {
public:
  Posterior(std::int64_t N, double B, double conf)
  : N_(N), B_(B), conf_(conf), ctx_(describe(N, B, conf)),
    log_norm_(log_upper_gamma(N, B)),
    mode_(std::max(0.0, static_cast<double>(N) - B)),
    scale_(std::max(1.0, std::sqrt(static_cast<double>(N) + 1.0)))
  {
    if (!std::isfinite(log_norm_))
      throw NumericalError("BayesRate: posterior normalisation is not finite (" + ctx_ + ")");
  }

  double cdf(double s) const {
    if (s <= 0.0) return 0.0;
    if (std::isinf(s)) return 1.0;
    return 1.0 - std::exp(log_upper_gamma(N_, s + B_) - log_norm_);
  }

  double mean() const {
    const double lq2 = log_upper_gamma(N_ + 1, B_);
    const double m = std::exp(std::log(static_cast<double>(N_) + 1.0) + lq2 - log_norm_) - B_;
    return m < 0.0 ? 0.0 : m;
  }

  KBNInterval Solve() const {
    KBNInterval r;
    r.s_mean = mean();

    if (static_cast<double>(N_) <= B_) {
      // Density is monotonically decreasing on S >= 0.
      r.s_max = one_sided_upper();
      check_mass(0.0, r.s_max);
      return r;
    }

    // Equal-density interval anchored at S=0; if it already holds conf,
    // the highest-density region includes zero.
    if (B_ > 0.0) {
      const double s2_at_zero = partner(0.0);
      if (cdf(s2_at_zero) <= conf_) {
        r.s_max = one_sided_upper();
        check_mass(0.0, r.s_max);
        return r;
      }
    }

    auto excess = [this](double s1) {
      if (s1 + B_ <= 0.0) return 1.0 - conf_;
      return cdf(partner(s1)) - cdf(s1) - conf_;
    };
    const double s1 = solve_bracketed(excess, 0.0, mode_, "lower bound", ctx_);
    r.s_min = s1;
    r.s_max = partner(s1);
    check_mass(r.s_min, r.s_max);
    return r;
  }

private:
  // Point above the mode with the same posterior density as s1 (s1 <= mode).
  double partner(double s1) const {
    const double level = log_density(N_, B_, s1);
    if (!std::isfinite(level)) return std::numeric_limits<double>::infinity();
    if (level >= log_density(N_, B_, mode_)) return mode_;

    double step = scale_;
    int grow = 0;
    while (log_density(N_, B_, mode_ + step) > level) {
      step *= 2.0;
      if (++grow > kMaxBracketGrow)
        throw NumericalError("BayesRate: cannot bracket upper bound (" + ctx_ + ")");
    }
    auto f = [this, level](double s) { return log_density(N_, B_, s) - level; };
    return solve_bracketed(f, mode_, mode_ + step, "upper bound", ctx_);
  }

  double one_sided_upper() const {
    double hi = mode_ + scale_;
    int grow = 0;
    while (cdf(hi) < conf_) {
      hi = mode_ + 2.0 * (hi - mode_);
      if (++grow > kMaxBracketGrow)
        throw NumericalError("BayesRate: cannot bracket one-sided upper bound (" + ctx_ + ")");
    }
    auto f = [this](double s) { return cdf(s) - conf_; };
    return solve_bracketed(f, 0.0, hi, "one-sided upper bound", ctx_);
  }

  void check_mass(double s1, double s2) const {
    const double mass = cdf(s2) - cdf(s1);
    if (!(std::fabs(mass - conf_) <= kMassTolerance)) {
      std::ostringstream os;
      os << "BayesRate: enclosed probability " << mass << " misses target by more than "
         << kMassTolerance << " (" << ctx_ << ")";
      throw NumericalError(os.str());
    }
  }

  std::int64_t N_;
  double       B_;
  double       conf_;
  std::string  ctx_;
  double       log_norm_;
  double       mode_;
  double       scale_;
};

} // namespace

KBNInterval BayesRate(std::int64_t N, double B, double conf) {
  if (N < 0)
    throw InvalidArgument("BayesRate: N must be >= 0 (" + describe(N, B, conf) + ")");
  if (!std::isfinite(B) || B < 0.0)
    throw InvalidArgument("BayesRate: B must be finite and >= 0 (" + describe(N, B, conf) + ")");
  if (!(conf > 0.0 && conf < 1.0))
    throw InvalidArgument("BayesRate: conf must lie in (0,1) (" + describe(N, B, conf) + ")");

  return Posterior(N, B, conf).Solve();
}

KBNInterval BayesRate(double N, double B, double conf) {
  if (!std::isfinite(N) || N < 0.0 || std::floor(N) != N) {
    std::ostringstream os;
    os << "BayesRate: N must be a non-negative integer, got " << N;
    throw InvalidArgument(os.str());
  }
  // int64 max converts to exactly 2^63, which itself is out of range.
  if (N >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    std::ostringstream os;
    os << "BayesRate: N exceeds the 64-bit integer range, got " << N;
    throw InvalidArgument(os.str());
  }
  return BayesRate(static_cast<std::int64_t>(N), B, conf);
}

double PosteriorCDF(std::int64_t N, double B, double s) {
  return Posterior(N, B, 0.5).cdf(s);
}

} // namespace lcmerge::stats
