#include <aquifer/budget.hpp>

#include <aquifer/derivative.hpp>

namespace aquifer {

Budget aggregate_budget(const SteadyState& sol) {
  const DerivativeResult& d = sol.derivative;
  Budget b;
  b.total_aero_min = d.total_aero_min;
  b.total_denitri = d.total_denitri;
  b.total_nitri = d.total_nitri;
  b.total_aeration = d.total_aeration;
  b.flux = d.flux;
  return b;
}

std::map<std::string, double> budget_fields(const Budget& b) {
  std::map<std::string, double> out;
  out["total_aero_min"] = b.total_aero_min;
  out["total_denitri"] = b.total_denitri;
  out["total_nitri"] = b.total_nitri;
  out["total_aeration"] = b.total_aeration;
  for (Species s : kAllSpecies) {
    const std::string name = species_name(s);
    out["flux_up_" + name] = b.flux[index_of(s)].up;
    out["flux_down_" + name] = b.flux[index_of(s)].down;
  }
  return out;
}

std::array<double, kNumSpecies> net_reaction_source(const Budget& b) {
  const Stoichiometry& nu = stoichiometry();
  const std::array<double, kNumRates> totals = {
      b.total_aero_min, b.total_denitri, b.total_nitri, b.total_aeration};

  std::array<double, kNumSpecies> out{};
  for (std::size_t s = 0; s < kNumSpecies; ++s) {
    for (std::size_t q = 0; q < kNumRates; ++q) out[s] += nu[s][q] * totals[q];
  }
  return out;
}

} // namespace aquifer
