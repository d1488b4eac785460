#include <UnitTest++.h>

#include <array>
#include <cmath>
#include <map>
#include <string>

#include <aquifer/budget.hpp>
#include <aquifer/steady.hpp>
#include <aquifer/verify.hpp>

using namespace aquifer;

SUITE(BudgetAggregator)
{
  TEST(SelectsDiagnosticFieldsVerbatim)
  {
    SteadyState sol;
    sol.derivative.total_aero_min = 1.5;
    sol.derivative.total_denitri = 2.5;
    sol.derivative.total_nitri = 3.5;
    sol.derivative.total_aeration = 4.5;
    for (std::size_t s = 0; s < kNumSpecies; ++s) {
      sol.derivative.flux[s].up = 10.0 + static_cast<double>(s);
      sol.derivative.flux[s].down = 20.0 + static_cast<double>(s);
    }

    Budget b = aggregate_budget(sol);
    std::map<std::string, double> f = budget_fields(b);

    CHECK_EQUAL(14u, f.size());
    CHECK_CLOSE(1.5, f.at("total_aero_min"), 0.0);
    CHECK_CLOSE(2.5, f.at("total_denitri"), 0.0);
    CHECK_CLOSE(3.5, f.at("total_nitri"), 0.0);
    CHECK_CLOSE(4.5, f.at("total_aeration"), 0.0);
    CHECK_CLOSE(10.0, f.at("flux_up_DON"), 0.0);
    CHECK_CLOSE(21.0, f.at("flux_down_O2"), 0.0);
    CHECK_CLOSE(12.0, f.at("flux_up_NO3"), 0.0);
    CHECK_CLOSE(23.0, f.at("flux_down_NH3"), 0.0);
    CHECK_CLOSE(14.0, f.at("flux_up_N2"), 0.0);
    CHECK_CLOSE(24.0, f.at("flux_down_N2"), 0.0);
  }

  TEST(NetSourcesFollowStoichiometry)
  {
    Budget b;
    b.total_aero_min = 10.0;
    b.total_denitri = 5.0;
    b.total_nitri = 2.0;
    b.total_aeration = 7.0;

    std::array<double, kNumSpecies> src = net_reaction_source(b);
    CHECK_CLOSE(-15.0, src[index_of(Species::DON)], 1e-14);
    CHECK_CLOSE(7.0 - 10.0 - 4.0, src[index_of(Species::O2)], 1e-14);
    CHECK_CLOSE(-4.0 + 2.0, src[index_of(Species::NO3)], 1e-14);
    CHECK_CLOSE(15.0 * 16.0 / 106.0 - 2.0, src[index_of(Species::NH3)], 1e-14);
    CHECK_CLOSE(2.0, src[index_of(Species::N2)], 1e-14);
  }

  TEST(ConvergedSolveBalancesEverySpecies)
  {
    ParameterSet p;
    Grid1D g(100, 200.0);
    SteadyState sol = solve_steady(p, g);

    Budget b = aggregate_budget(sol);
    std::array<double, kNumSpecies> src = net_reaction_source(b);
    for (std::size_t s = 0; s < kNumSpecies; ++s) {
      const double scale = std::fabs(b.flux[s].up) + std::fabs(b.flux[s].down) + std::fabs(src[s]);
      CHECK(std::fabs(b.flux[s].up - b.flux[s].down + src[s]) <= 1e-7 * scale + 1e-9);
    }

    // Nothing enters as N2; all of it leaves downstream.
    CHECK_CLOSE(0.0, b.flux[index_of(Species::N2)].up, 1e-12);
    CHECK(b.flux[index_of(Species::N2)].down > 0.0);
  }

  TEST(VerificationReportOnConvergedSolve)
  {
    AquiferConfig cfg;
    cfg.n_cells = 80;
    cfg.L = 160.0;
    cfg.verify_refinement = true;
    Grid1D g(cfg.n_cells, cfg.L);
    SteadyState sol = solve_steady(cfg.params, g, cfg.solver);

    VerificationReport r = verify_steady(cfg, g, sol);
    CHECK(r.residual_ok);
    CHECK(r.nonnegative_ok);
    CHECK(r.balance_ok);
    CHECK(r.all_ok());
    CHECK(r.has_refinement);
    for (Species s : kAllSpecies) {
      CHECK(r.refinement_diff[index_of(s)] < 0.5 * cfg.params.river(Species::NO3));
    }
  }
}
