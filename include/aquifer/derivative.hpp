#pragma once

#include <aquifer/grid.hpp>
#include <aquifer/kinetics.hpp>
#include <aquifer/linalg.hpp>
#include <aquifer/parameters.hpp>
#include <aquifer/transport.hpp>
#include <aquifer/types.hpp>

#include <array>
#include <vector>

namespace aquifer {

struct DerivativeResult {
  StateVector dCdt;  // [kNumSpecies * n_cells], same layout as the state

  // Domain integrals sum(rate * dx * VF) [mmol/m^2/d]
  double total_aero_min = 0.0;
  double total_denitri = 0.0;
  double total_nitri = 0.0;
  double total_aeration = 0.0;

  // Upstream/downstream boundary fluxes per species, indexed by index_of(Species).
  std::array<BoundaryFluxes, kNumSpecies> flux{};

  // Per-cell rates of this evaluation.
  ReactionRates rates;
};

// Stoichiometric matrix nu[species][rate], rate order aeroMin, denitri, nitri, aeration.
using Stoichiometry = std::array<std::array<double, kNumRates>, kNumSpecies>;
const Stoichiometry& stoichiometry();

TransportCoefficients transport_coefficients(const ParameterSet& p);

std::size_t state_size(const Grid1D& grid);

// Copy of species s from a concatenated state.
std::vector<double> species_slice(const StateVector& C, Species s, std::size_t n_cells);

// dC/dt of the coupled advection-dispersion-reaction system. Pure; the time
// argument is accepted for solver interfaces and not used.
DerivativeResult evaluate_derivative(double t,
                                     const StateVector& C,
                                     const ParameterSet& p,
                                     const Grid1D& grid);

// dF/dC assembled from the transport stencil and the local rate partials.
BlockTridiagonal assemble_jacobian(const StateVector& C,
                                   const ParameterSet& p,
                                   const Grid1D& grid);

// dF/dC by coloured forward differences (3 cell colours per species).
BlockTridiagonal finite_difference_jacobian(const StateVector& C,
                                            const ParameterSet& p,
                                            const Grid1D& grid);

} // namespace aquifer
