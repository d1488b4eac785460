#include <aquifer/verify.hpp>

#include <aquifer/budget.hpp>
#include <aquifer/profile.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace aquifer {

std::array<double, kNumSpecies> balance_mismatch(const SteadyState& sol) {
  const Budget b = aggregate_budget(sol);
  const std::array<double, kNumSpecies> src = net_reaction_source(b);

  std::array<double, kNumSpecies> out{};
  for (std::size_t s = 0; s < kNumSpecies; ++s) {
    const double up = b.flux[s].up;
    const double down = b.flux[s].down;
    const double scale = std::max({std::fabs(up), std::fabs(down), std::fabs(src[s])});
    const double mismatch = std::fabs(up - down + src[s]);
    out[s] = (scale > 0.0) ? mismatch / scale : mismatch;
  }
  return out;
}

VerificationReport verify_steady(const AquiferConfig& cfg,
                                 const Grid1D& grid,
                                 const SteadyState& sol) {
  VerificationReport r;

  r.max_residual = 0.0;
  for (double v : sol.derivative.dCdt) r.max_residual = std::max(r.max_residual, std::fabs(v));
  r.residual_ok = (r.max_residual <= cfg.solver.atol);

  r.min_concentration = std::numeric_limits<double>::infinity();
  for (double c : sol.C) r.min_concentration = std::min(r.min_concentration, c);
  r.nonnegative_ok = (r.min_concentration >= 0.0);

  r.balance_mismatch = balance_mismatch(sol);
  r.balance_ok = std::all_of(r.balance_mismatch.begin(), r.balance_mismatch.end(),
                             [&](double m) { return m <= cfg.balance_tol; });

  if (cfg.verify_refinement) {
    Grid1D fine(2 * grid.n_cells(), grid.length());
    SolverOptions opt = cfg.solver;
    opt.log = nullptr;
    SteadyState fine_sol = solve_steady(cfg.params, fine, opt);

    const auto coarse_prof = split_profiles(sol, grid);
    const auto fine_prof = split_profiles(fine_sol, fine);
    for (std::size_t s = 0; s < kNumSpecies; ++s) {
      Profile1D pc(grid.xc(), coarse_prof[s]);
      Profile1D pf(fine.xc(), fine_prof[s]);
      r.refinement_diff[s] = max_abs_difference(pc, pf);
    }
    r.has_refinement = true;
  }

  return r;
}

} // namespace aquifer
