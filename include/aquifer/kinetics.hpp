#pragma once

#include <aquifer/parameters.hpp>

#include <array>
#include <cstddef>
#include <vector>

namespace aquifer {

constexpr std::size_t kNumRates = 4;

// Per-cell rates [mmol/m^3/d], recomputed on every evaluation.
struct ReactionRates {
  std::vector<double> aeroMin;    // aerobic mineralisation of DON
  std::vector<double> denitri;    // denitrification
  std::vector<double> nitri;      // nitrification
  std::vector<double> aeration;   // re-aeration towards O2_sol
};

// aeroMin  = r_aeromin O2/(O2+kO2) DON
// denitri  = r_denitr NO3/(NO3+kNO3) kO2/(O2+kO2) DON
// nitri    = r_nitri O2 NH3
// aeration = r_aera (O2_sol - O2)
ReactionRates compute_rates(const std::vector<double>& DON,
                            const std::vector<double>& O2,
                            const std::vector<double>& NO3,
                            const std::vector<double>& NH3,
                            const ParameterSet& p);

// Local partial derivatives of the four rates with respect to
// (DON, O2, NO3, NH3) in one cell: dr[rate][reactant].
// Rate order: aeroMin, denitri, nitri, aeration.
using RatePartials = std::array<std::array<double, 4>, kNumRates>;

RatePartials rate_partials(double DON, double O2, double NO3, double NH3, const ParameterSet& p);

} // namespace aquifer
