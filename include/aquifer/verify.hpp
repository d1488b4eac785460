#pragma once

#include <aquifer/config.hpp>
#include <aquifer/grid.hpp>
#include <aquifer/steady.hpp>
#include <aquifer/types.hpp>

#include <array>

namespace aquifer {

struct VerificationReport {
  bool residual_ok = false;
  double max_residual = 0.0;       // max |dC/dt|

  bool nonnegative_ok = false;
  double min_concentration = 0.0;

  // Per species |flux_up - flux_down + net source| relative to the largest term.
  bool balance_ok = false;
  std::array<double, kNumSpecies> balance_mismatch{};

  // Max |C_N - C_2N| at the coarse cell centres (only if requested).
  bool has_refinement = false;
  std::array<double, kNumSpecies> refinement_diff{};

  bool all_ok() const { return residual_ok && nonnegative_ok && balance_ok; }
};

// Per species mass balance of a converged solve.
std::array<double, kNumSpecies> balance_mismatch(const SteadyState& sol);

VerificationReport verify_steady(const AquiferConfig& cfg,
                                 const Grid1D& grid,
                                 const SteadyState& sol);

} // namespace aquifer
