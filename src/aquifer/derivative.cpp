#include <aquifer/derivative.hpp>

#include <aquifer/constants.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>

namespace aquifer {

const Stoichiometry& stoichiometry() {
  //                            aeroMin       denitri       nitri     aeration
  static const Stoichiometry nu = {{
      {{-1.0,         -1.0,          0.0,       0.0}},  // DON
      {{-1.0,          0.0,         -kNitriO2,  1.0}},  // O2
      {{ 0.0,         -kDenitriNO3,  1.0,       0.0}},  // NO3
      {{ kRedfieldNC,  kRedfieldNC, -1.0,       0.0}},  // NH3
      {{ 0.0,          kDenitriN2,   0.0,       0.0}},  // N2
  }};
  return nu;
}

TransportCoefficients transport_coefficients(const ParameterSet& p) {
  TransportCoefficients coef;
  coef.D = p.dispersion();
  coef.v = p.v_adv;
  coef.VF = p.por;
  return coef;
}

std::size_t state_size(const Grid1D& grid) {
  return kNumSpecies * grid.n_cells();
}

std::vector<double> species_slice(const StateVector& C, Species s, std::size_t n_cells) {
  if (C.size() != kNumSpecies * n_cells) {
    throw std::runtime_error("species_slice: state length is not 5*N");
  }
  auto first = C.begin() + static_cast<std::ptrdiff_t>(index_of(s) * n_cells);
  return std::vector<double>(first, first + static_cast<std::ptrdiff_t>(n_cells));
}

DerivativeResult evaluate_derivative(double /*t*/,
                                     const StateVector& C,
                                     const ParameterSet& p,
                                     const Grid1D& grid) {
  const std::size_t n = grid.n_cells();
  if (C.size() != state_size(grid)) {
    throw std::runtime_error("evaluate_derivative: state length is not 5*N");
  }

  const TransportCoefficients coef = transport_coefficients(p);

  std::array<std::vector<double>, kNumSpecies> conc;
  std::array<TransportResult, kNumSpecies> tr;
  for (Species s : kAllSpecies) {
    const std::size_t i = index_of(s);
    conc[i] = species_slice(C, s, n);
    tr[i] = transport_1d(conc[i], p.river(s), coef, grid);
  }

  DerivativeResult out;
  out.rates = compute_rates(conc[index_of(Species::DON)], conc[index_of(Species::O2)],
                            conc[index_of(Species::NO3)], conc[index_of(Species::NH3)], p);
  const ReactionRates& r = out.rates;

  out.dCdt.assign(state_size(grid), 0.0);
  double* dDON = &out.dCdt[index_of(Species::DON) * n];
  double* dO2 = &out.dCdt[index_of(Species::O2) * n];
  double* dNO3 = &out.dCdt[index_of(Species::NO3) * n];
  double* dNH3 = &out.dCdt[index_of(Species::NH3) * n];
  double* dN2 = &out.dCdt[index_of(Species::N2) * n];

  for (std::size_t k = 0; k < n; ++k) {
    dDON[k] = tr[0].dC[k] - r.aeroMin[k] - r.denitri[k];
    dO2[k]  = tr[1].dC[k] + r.aeration[k] - r.aeroMin[k] - kNitriO2 * r.nitri[k];
    dNO3[k] = tr[2].dC[k] - kDenitriNO3 * r.denitri[k] + r.nitri[k];
    dNH3[k] = tr[3].dC[k] + (r.aeroMin[k] + r.denitri[k]) * kRedfieldNC - r.nitri[k];
    dN2[k]  = tr[4].dC[k] + kDenitriN2 * r.denitri[k];
  }

  const double w = grid.dx() * p.por;
  for (std::size_t k = 0; k < n; ++k) {
    out.total_aero_min += r.aeroMin[k] * w;
    out.total_denitri += r.denitri[k] * w;
    out.total_nitri += r.nitri[k] * w;
    out.total_aeration += r.aeration[k] * w;
  }

  for (std::size_t i = 0; i < kNumSpecies; ++i) {
    out.flux[i].up = tr[i].flux_up;
    out.flux[i].down = tr[i].flux_down;
  }
  return out;
}

BlockTridiagonal assemble_jacobian(const StateVector& C,
                                   const ParameterSet& p,
                                   const Grid1D& grid) {
  const std::size_t n = grid.n_cells();
  if (C.size() != state_size(grid)) {
    throw std::runtime_error("assemble_jacobian: state length is not 5*N");
  }

  BlockTridiagonal J(n);
  const TransportStencil st = transport_stencil(transport_coefficients(p), grid);
  const Stoichiometry& nu = stoichiometry();

  for (std::size_t j = 0; j < n; ++j) {
    // Transport couples each species to itself in the neighbouring cells.
    for (std::size_t s = 0; s < kNumSpecies; ++s) {
      at(J.diag(j), s, s) += st.diag[j];
      if (j > 0) at(J.lower(j), s, s) += st.lower[j];
      if (j + 1 < n) at(J.upper(j), s, s) += st.upper[j];
    }

    // Reactions couple species pointwise.
    const RatePartials dr = rate_partials(C[index_of(Species::DON) * n + j],
                                          C[index_of(Species::O2) * n + j],
                                          C[index_of(Species::NO3) * n + j],
                                          C[index_of(Species::NH3) * n + j], p);
    for (std::size_t s = 0; s < kNumSpecies; ++s) {
      for (std::size_t c = 0; c < 4; ++c) {
        double v = 0.0;
        for (std::size_t q = 0; q < kNumRates; ++q) v += nu[s][q] * dr[q][c];
        at(J.diag(j), s, c) += v;
      }
    }
  }
  return J;
}

BlockTridiagonal finite_difference_jacobian(const StateVector& C,
                                            const ParameterSet& p,
                                            const Grid1D& grid) {
  const std::size_t n = grid.n_cells();
  const StateVector F0 = evaluate_derivative(0.0, C, p, grid).dCdt;
  const double sqrt_eps = std::sqrt(std::numeric_limits<double>::epsilon());

  BlockTridiagonal J(n);

  // Cells three apart never share a residual entry, so one evaluation per
  // (species, colour) recovers all columns of that colour. Columns of
  // different colours write disjoint entries of J.
  const int n_colors = static_cast<int>(3 * kNumSpecies);

#ifdef AQUIFER_HAS_OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
  for (int color = 0; color < n_colors; ++color) {
    const std::size_t s = static_cast<std::size_t>(color) / 3;
    const std::size_t phase = static_cast<std::size_t>(color) % 3;
    if (phase >= n) continue;

    StateVector Cp = C;
    std::vector<double> h(n, 0.0);
    for (std::size_t j = phase; j < n; j += 3) {
      const std::size_t idx = s * n + j;
      Cp[idx] = C[idx] + sqrt_eps * std::max(std::fabs(C[idx]), 1.0);
      h[j] = Cp[idx] - C[idx];
    }

    const StateVector Fp = evaluate_derivative(0.0, Cp, p, grid).dCdt;

    for (std::size_t j = phase; j < n; j += 3) {
      const std::size_t k0 = (j > 0) ? j - 1 : j;
      const std::size_t k1 = std::min(j + 1, n - 1);
      for (std::size_t k = k0; k <= k1; ++k) {
        for (std::size_t row = 0; row < kNumSpecies; ++row) {
          const double v = (Fp[row * n + k] - F0[row * n + k]) / h[j];
          if (k == j) {
            at(J.diag(k), row, s) = v;
          } else if (k + 1 == j) {
            at(J.upper(k), row, s) = v;
          } else {
            at(J.lower(k), row, s) = v;
          }
        }
      }
    }
  }
  return J;
}

} // namespace aquifer
