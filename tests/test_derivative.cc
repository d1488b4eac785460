#include <UnitTest++.h>

#include <cmath>
#include <vector>

#include <aquifer/constants.hpp>
#include <aquifer/derivative.hpp>

using namespace aquifer;

namespace {

// Smooth positive state, distinct per species.
StateVector sample_state(const Grid1D& g)
{
  const std::size_t n = g.n_cells();
  StateVector C(state_size(g));
  for (std::size_t s = 0; s < kNumSpecies; ++s) {
    for (std::size_t j = 0; j < n; ++j) {
      double x = g.xc()[j] / g.length();
      C[s * n + j] = 10.0 * static_cast<double>(s + 1) * (1.0 + 0.5 * std::cos(3.0 * x + static_cast<double>(s)));
    }
  }
  return C;
}

}  // namespace

SUITE(DerivativeFunction)
{
  TEST(SpeciesSlicesAreContiguous)
  {
    Grid1D g(3, 3.0);
    StateVector C = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15};
    std::vector<double> no3 = species_slice(C, Species::NO3, 3);
    CHECK_EQUAL(3u, no3.size());
    CHECK_CLOSE(7.0, no3[0], 0.0);
    CHECK_CLOSE(9.0, no3[2], 0.0);
    std::vector<double> n2 = species_slice(C, Species::N2, 3);
    CHECK_CLOSE(13.0, n2[0], 0.0);
    CHECK_THROW(species_slice(C, Species::DON, 4), std::runtime_error);
  }

  TEST(DegenerateSmallGridAtZeroState)
  {
    ParameterSet p;
    Grid1D g(5, 500.0);  // dx = 100
    StateVector C(state_size(g), 0.0);

    DerivativeResult d = evaluate_derivative(0.0, C, p, g);
    CHECK_EQUAL(25u, d.dCdt.size());

    const double dx = g.dx();
    const double inflow = (p.v_adv + p.dispersion() / dx) / dx;  // per unit boundary concentration
    const double aer = p.r_aera * p.O2_sol;

    for (Species s : kAllSpecies) {
      const std::size_t i = index_of(s);
      const double extra = (s == Species::O2) ? aer : 0.0;
      CHECK_CLOSE(p.river(s) * inflow + extra, d.dCdt[i * 5 + 0], 1e-12);
      for (std::size_t j = 1; j < 5; ++j) CHECK_CLOSE(extra, d.dCdt[i * 5 + j], 1e-12);

      CHECK_CLOSE(p.por * (p.v_adv + p.dispersion() / dx) * p.river(s), d.flux[i].up, 1e-12);
      CHECK_CLOSE(0.0, d.flux[i].down, 0.0);
    }

    CHECK_CLOSE(0.0, d.total_aero_min, 0.0);
    CHECK_CLOSE(0.0, d.total_denitri, 0.0);
    CHECK_CLOSE(0.0, d.total_nitri, 0.0);
    CHECK_CLOSE(aer * g.length() * p.por, d.total_aeration, 1e-9);
  }

  TEST(DegenerateSmallGridPureAdvectionInflow)
  {
    // No dispersion: the first cell sees river * v_adv * VF / dx per bulk volume.
    ParameterSet p;
    p.a = 0.0;
    Grid1D g(5, 500.0);
    StateVector C(state_size(g), 0.0);

    DerivativeResult d = evaluate_derivative(0.0, C, p, g);

    const double dx = g.dx();
    for (Species s : kAllSpecies) {
      const std::size_t i = index_of(s);
      const double extra = (s == Species::O2) ? p.r_aera * p.O2_sol : 0.0;
      CHECK_CLOSE(p.river(s) * p.v_adv * p.por / dx, p.por * (d.dCdt[i * 5 + 0] - extra), 1e-12);
      CHECK_CLOSE(p.river(s) * p.v_adv * p.por, d.flux[i].up, 1e-12);
    }
  }

  TEST(StoichiometricCombination)
  {
    ParameterSet p;
    Grid1D g(8, 40.0);
    const std::size_t n = g.n_cells();
    StateVector C = sample_state(g);

    DerivativeResult d = evaluate_derivative(0.0, C, p, g);
    TransportCoefficients coef = transport_coefficients(p);

    std::vector<double> tr[kNumSpecies];
    for (Species s : kAllSpecies) {
      tr[index_of(s)] = transport_1d(species_slice(C, s, n), p.river(s), coef, g).dC;
    }
    ReactionRates r = compute_rates(species_slice(C, Species::DON, n), species_slice(C, Species::O2, n),
                                    species_slice(C, Species::NO3, n), species_slice(C, Species::NH3, n), p);

    for (std::size_t k = 0; k < n; ++k) {
      CHECK_CLOSE(tr[0][k] - r.aeroMin[k] - r.denitri[k], d.dCdt[0 * n + k], 1e-12);
      CHECK_CLOSE(tr[1][k] + r.aeration[k] - r.aeroMin[k] - 2.0 * r.nitri[k], d.dCdt[1 * n + k], 1e-12);
      CHECK_CLOSE(tr[2][k] - 0.8 * r.denitri[k] + r.nitri[k], d.dCdt[2 * n + k], 1e-12);
      CHECK_CLOSE(tr[3][k] + (r.aeroMin[k] + r.denitri[k]) * 16.0 / 106.0 - r.nitri[k], d.dCdt[3 * n + k], 1e-12);
      CHECK_CLOSE(tr[4][k] + 0.4 * r.denitri[k], d.dCdt[4 * n + k], 1e-12);
    }

    double tot = 0.0;
    for (double v : r.nitri) tot += v * g.dx() * p.por;
    CHECK_CLOSE(tot, d.total_nitri, 1e-10);
  }

  TEST(IntegratedDerivativeEqualsFluxesPlusSources)
  {
    ParameterSet p;
    Grid1D g(12, 60.0);
    const std::size_t n = g.n_cells();
    StateVector C = sample_state(g);
    DerivativeResult d = evaluate_derivative(0.0, C, p, g);

    const Stoichiometry& nu = stoichiometry();
    const double totals[kNumRates] = {d.total_aero_min, d.total_denitri, d.total_nitri, d.total_aeration};

    for (std::size_t s = 0; s < kNumSpecies; ++s) {
      double lhs = 0.0;
      for (std::size_t k = 0; k < n; ++k) lhs += d.dCdt[s * n + k] * g.dx() * p.por;
      double src = 0.0;
      for (std::size_t q = 0; q < kNumRates; ++q) src += nu[s][q] * totals[q];
      CHECK_CLOSE(d.flux[s].up - d.flux[s].down + src, lhs, 1e-9);
    }
  }

  TEST(AnalyticJacobianMatchesFiniteDifferences)
  {
    ParameterSet p;
    Grid1D g(7, 14.0);
    StateVector C = sample_state(g);

    BlockTridiagonal Ja = assemble_jacobian(C, p, g);
    BlockTridiagonal Jf = finite_difference_jacobian(C, p, g);

    for (std::size_t j = 0; j < g.n_cells(); ++j) {
      for (std::size_t r = 0; r < kBlock; ++r) {
        for (std::size_t c = 0; c < kBlock; ++c) {
          CHECK_CLOSE(at(Ja.diag(j), r, c), at(Jf.diag(j), r, c), 1e-5);
          if (j > 0) CHECK_CLOSE(at(Ja.lower(j), r, c), at(Jf.lower(j), r, c), 1e-5);
          if (j + 1 < g.n_cells()) CHECK_CLOSE(at(Ja.upper(j), r, c), at(Jf.upper(j), r, c), 1e-5);
        }
      }
    }
  }

  TEST(IsPureAcrossCalls)
  {
    ParameterSet p;
    Grid1D g(6, 30.0);
    StateVector C = sample_state(g);
    StateVector Z(state_size(g), 0.0);

    DerivativeResult a = evaluate_derivative(0.0, C, p, g);
    evaluate_derivative(5.0, Z, p, g);
    DerivativeResult b = evaluate_derivative(123.0, C, p, g);
    for (std::size_t i = 0; i < a.dCdt.size(); ++i) CHECK_CLOSE(a.dCdt[i], b.dCdt[i], 0.0);
  }

  TEST(RejectsWrongStateLength)
  {
    ParameterSet p;
    Grid1D g(4, 4.0);
    StateVector C(19, 0.0);
    CHECK_THROW(evaluate_derivative(0.0, C, p, g), std::runtime_error);
  }
}
