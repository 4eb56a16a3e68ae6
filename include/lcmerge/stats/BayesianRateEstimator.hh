#pragma once

#include <cstdint>

namespace lcmerge::stats {

/// Confidence interval and posterior mean on the source counts S.
struct KBNInterval {
  double s_min  = 0.0;
  double s_max  = 0.0;
  double s_mean = 0.0;
};

/// Probability mass accuracy required of every interval.
constexpr double kMassTolerance = 1e-6;

/**
 * Bayesian source-count interval for Poisson counts with known background,
 * after Kraft, Burrows & Nousek (1991), ApJ 374, 344.
 *
 * Posterior on S >= 0:
 *   p(S | N, B) = exp(-(S+B)) (S+B)^N / (N! * Q(N+1, B))
 * with Q the regularized upper incomplete gamma function.
 *
 * The interval is the highest-density region holding probability `conf`
 * (equal posterior ordinate at both ends). When that region reaches S=0
 * the interval is one-sided, s_min = 0 and F(s_max) = conf.
 *
 * s_mean is the posterior expectation of S.
 *
 * Throws InvalidArgument for N < 0, non-finite or negative B, or conf
 * outside (0,1); NumericalError if the root finder does not converge.
 */
KBNInterval BayesRate(std::int64_t N, double B, double conf);

/// Same as above for counts held as a floating-point value (as they are
/// in parsed tables). Non-integral N is an InvalidArgument.
KBNInterval BayesRate(double N, double B, double conf);

/// Posterior probability P(S <= s | N, B). Exposed for tests and
/// diagnostics; arguments are not validated.
double PosteriorCDF(std::int64_t N, double B, double s);

} // namespace lcmerge::stats
