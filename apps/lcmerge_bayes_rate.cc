#include "lcmerge/stats/BayesianRateEstimator.hh"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  if (argc < 4) { std::cerr << "usage: lcmerge_bayes_rate <N> <B> <conf>\n"; return 1; }

  try {
    const double N    = std::stod(argv[1]);
    const double B    = std::stod(argv[2]);
    const double conf = std::stod(argv[3]);

    const auto iv = lcmerge::stats::BayesRate(N, B, conf);

    std::cout << std::setprecision(8)
              << "[KBN] N=" << N << " B=" << B << " conf=" << conf << "\n"
              << "  S_min : " << iv.s_min << "\n"
              << "  S_max : " << iv.s_max << "\n"
              << "  S_mean: " << iv.s_mean << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n"; return 2;
  }
}
