#pragma once

#include <aquifer/derivative.hpp>
#include <aquifer/grid.hpp>
#include <aquifer/parameters.hpp>
#include <aquifer/types.hpp>

#include <iosfwd>
#include <string>

namespace aquifer {

struct SolverOptions {
  double atol = 1e-10;
  double rtol = 1e-10;
  int max_iter = 500;
  std::string jacobian = "analytic";  // analytic | fd

  // Pseudo-transient continuation: (I/dtau - J) dC = F
  double pseudo_dt0 = 1.0;           // [d]
  double pseudo_dt_max = 1e12;       // [d]
  double pseudo_dt_growth = 2.0;     // minimum growth per accepted step

  double positivity_floor = 0.0;     // iterates are projected onto C >= floor
  int max_stalled = 25;              // projected iterations without progress

  std::ostream* log = nullptr;       // per-iteration trace, null => quiet
};

struct SteadyState {
  StateVector C;                 // converged state, C >= 0
  DerivativeResult derivative;   // evaluated at C
  int iterations = 0;
  double residual = 0.0;         // max |dC/dt| at C
  double pseudo_dt = 0.0;        // final pseudo time step
};

// Projected Newton iteration with pseudo-transient continuation.
// Throws InvalidParameterError, NonConvergenceError, NonPhysicalStateError
// or NumericalInstabilityError; never returns an unconverged state.
SteadyState solve_steady(const StateVector& C0,
                         const ParameterSet& p,
                         const Grid1D& grid,
                         const SolverOptions& opt);

// Same, starting from the zero state.
SteadyState solve_steady(const ParameterSet& p,
                         const Grid1D& grid,
                         const SolverOptions& opt = SolverOptions{});

// Converged state split into per-species profiles on grid.xc().
std::array<std::vector<double>, kNumSpecies> split_profiles(const SteadyState& sol,
                                                            const Grid1D& grid);

} // namespace aquifer
