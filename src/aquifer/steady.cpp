#include <aquifer/steady.hpp>

#include <aquifer/errors.hpp>
#include <aquifer/linalg.hpp>

#include <algorithm>
#include <cmath>
#include <ostream>
#include <stdexcept>

namespace aquifer {

namespace {

double max_abs(const std::vector<double>& a) {
  double m = 0.0;
  for (double v : a) m = std::max(m, std::fabs(v));
  return m;
}

bool all_finite(const std::vector<double>& a) {
  for (double v : a) {
    if (!std::isfinite(v)) return false;
  }
  return true;
}

// Species-major state <-> cell-major linear system ordering.
std::vector<double> to_cell_major(const std::vector<double>& x, std::size_t n) {
  std::vector<double> y(x.size());
  for (std::size_t s = 0; s < kNumSpecies; ++s) {
    for (std::size_t j = 0; j < n; ++j) y[j * kNumSpecies + s] = x[s * n + j];
  }
  return y;
}

std::vector<double> to_species_major(const std::vector<double>& y, std::size_t n) {
  std::vector<double> x(y.size());
  for (std::size_t s = 0; s < kNumSpecies; ++s) {
    for (std::size_t j = 0; j < n; ++j) x[s * n + j] = y[j * kNumSpecies + s];
  }
  return x;
}

BlockTridiagonal jacobian(const SolverOptions& opt,
                          const StateVector& C,
                          const ParameterSet& p,
                          const Grid1D& grid) {
  if (opt.jacobian == "fd") return finite_difference_jacobian(C, p, grid);
  return assemble_jacobian(C, p, grid);
}

void check_options(const SolverOptions& opt) {
  if (!(opt.atol > 0.0) || !(opt.rtol >= 0.0)) {
    throw std::runtime_error("solve_steady: atol must be > 0 and rtol >= 0");
  }
  if (opt.max_iter < 1) throw std::runtime_error("solve_steady: max_iter must be >= 1");
  if (opt.jacobian != "analytic" && opt.jacobian != "fd") {
    throw std::runtime_error("solve_steady: jacobian must be 'analytic' or 'fd'");
  }
  if (!(opt.pseudo_dt0 > 0.0) || !(opt.pseudo_dt_max >= opt.pseudo_dt0) ||
      !(opt.pseudo_dt_growth >= 1.0)) {
    throw std::runtime_error("solve_steady: invalid pseudo time step settings");
  }
  if (!(opt.positivity_floor >= 0.0) || !std::isfinite(opt.positivity_floor)) {
    throw std::runtime_error("solve_steady: positivity_floor must be finite and >= 0");
  }
}

} // namespace

SteadyState solve_steady(const StateVector& C0,
                         const ParameterSet& p,
                         const Grid1D& grid,
                         const SolverOptions& opt) {
  validate(p);
  check_options(opt);

  const std::size_t n = grid.n_cells();
  if (C0.size() != state_size(grid)) {
    throw std::runtime_error("solve_steady: initial state length is not 5*N");
  }
  if (!all_finite(C0)) {
    throw NumericalInstabilityError("solve_steady: non-finite initial state");
  }

  StateVector C = C0;
  for (double& c : C) c = std::max(c, opt.positivity_floor);

  DerivativeResult res = evaluate_derivative(0.0, C, p, grid);
  if (!all_finite(res.dCdt)) {
    throw NumericalInstabilityError("solve_steady: non-finite residual at the initial state");
  }
  double rnorm = max_abs(res.dCdt);

  const double dt_min = opt.pseudo_dt0 * 1e-12;
  double dtau = opt.pseudo_dt0;
  int stalled = 0;
  bool below_atol = false;

  for (int it = 1; it <= opt.max_iter; ++it) {
    BlockTridiagonal A = jacobian(opt, C, p, grid);
    if (!A.all_finite()) {
      throw NumericalInstabilityError("solve_steady: non-finite Jacobian at iteration " +
                                      std::to_string(it));
    }

    // (I/dtau - J) delta = F
    A.scale(-1.0);
    A.add_identity(1.0 / dtau);
    std::vector<double> delta = to_cell_major(res.dCdt, n);
    block_thomas_solve(A, delta);
    delta = to_species_major(delta, n);

    StateVector trial(C.size());
    bool projected = false;
    for (std::size_t i = 0; i < C.size(); ++i) {
      double v = C[i] + delta[i];
      if (v < opt.positivity_floor) {
        v = opt.positivity_floor;
        projected = true;
      }
      trial[i] = v;
    }

    DerivativeResult res_trial = evaluate_derivative(0.0, trial, p, grid);
    const bool finite = all_finite(trial) && all_finite(res_trial.dCdt);
    const double tnorm = finite ? max_abs(res_trial.dCdt) : 0.0;

    // Reject steps that blow up the residual and retry with a shorter pseudo step.
    if (!finite || tnorm > 10.0 * rnorm + opt.atol) {
      dtau *= 0.25;
      if (opt.log) {
        *opt.log << "[solver] it=" << it << " rejected step, dtau -> " << dtau << "\n";
      }
      if (dtau < dt_min) {
        throw NumericalInstabilityError(
            "solve_steady: pseudo time step collapsed at iteration " + std::to_string(it));
      }
      continue;
    }

    bool step_small = true;
    for (std::size_t i = 0; i < C.size(); ++i) {
      if (std::fabs(trial[i] - C[i]) > opt.atol + opt.rtol * std::fabs(trial[i])) {
        step_small = false;
        break;
      }
    }

    if (projected && tnorm >= rnorm) {
      ++stalled;
      if (stalled >= opt.max_stalled) {
        throw NonPhysicalStateError(
            it, "solve_steady: iterate cannot be kept non-negative without stalling (iteration " +
                    std::to_string(it) + ", residual " + std::to_string(tnorm) + ")");
      }
    } else {
      stalled = 0;
    }

    const double ratio = (tnorm > 0.0) ? rnorm / tnorm : opt.pseudo_dt_max;
    dtau = std::min(dtau * std::max(ratio, opt.pseudo_dt_growth), opt.pseudo_dt_max);

    C = std::move(trial);
    res = std::move(res_trial);
    rnorm = tnorm;

    if (opt.log) {
      *opt.log << "[solver] it=" << it << " residual=" << rnorm << " dtau=" << dtau
               << (projected ? " (projected)" : "") << "\n";
    }

    // Converged once the residual meets atol and either the update is within
    // atol + rtol|C| or the previous iterate already met atol (roundoff floor).
    const bool prev_below = below_atol;
    below_atol = rnorm <= opt.atol;
    if (below_atol && (step_small || prev_below)) {
      SteadyState sol;
      sol.C = std::move(C);
      sol.derivative = std::move(res);
      sol.iterations = it;
      sol.residual = rnorm;
      sol.pseudo_dt = dtau;
      return sol;
    }
  }

  throw NonConvergenceError(opt.max_iter, rnorm);
}

SteadyState solve_steady(const ParameterSet& p,
                         const Grid1D& grid,
                         const SolverOptions& opt) {
  return solve_steady(StateVector(state_size(grid), 0.0), p, grid, opt);
}

std::array<std::vector<double>, kNumSpecies> split_profiles(const SteadyState& sol,
                                                            const Grid1D& grid) {
  std::array<std::vector<double>, kNumSpecies> out;
  for (Species s : kAllSpecies) {
    out[index_of(s)] = species_slice(sol.C, s, grid.n_cells());
  }
  return out;
}

} // namespace aquifer
