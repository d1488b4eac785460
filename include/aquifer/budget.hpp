#pragma once

#include <aquifer/steady.hpp>
#include <aquifer/types.hpp>

#include <array>
#include <map>
#include <string>

namespace aquifer {

// Domain-integrated reaction totals and boundary fluxes of a converged solve
// [mmol/m^2/d].
struct Budget {
  double total_aero_min = 0.0;
  double total_denitri = 0.0;
  double total_nitri = 0.0;
  double total_aeration = 0.0;

  std::array<BoundaryFluxes, kNumSpecies> flux{};
};

Budget aggregate_budget(const SteadyState& sol);

// Flat named view: total_aero_min, total_denitri, total_nitri, total_aeration,
// flux_up_<species>, flux_down_<species>.
std::map<std::string, double> budget_fields(const Budget& b);

// Net domain-integrated reaction source of each species, by stoichiometry.
std::array<double, kNumSpecies> net_reaction_source(const Budget& b);

} // namespace aquifer
