#pragma once

#include <aquifer/grid.hpp>

#include <vector>

namespace aquifer {

// Transport coefficients shared by every species of a solve.
struct TransportCoefficients {
  double D = 0.0;    // dispersion [m^2/d]
  double v = 0.0;    // advective velocity [m/d]
  double VF = 1.0;   // volume fraction (porosity) [-]
};

struct TransportResult {
  std::vector<double> dC;    // [n_cells] transport contribution to dC/dt
  std::vector<double> flux;  // [n_cells+1] face fluxes, flux[0] at x=0
  double flux_up = 0.0;      // flux[0]
  double flux_down = 0.0;    // flux[n_cells]
};

// Finite-volume advection-dispersion operator for one species:
//   flux_f = -VF D (C_f - C_{f-1})/dx + VF v C_upwind
//   dC_j   = -(flux_{j+1} - flux_j) / (dx VF)
// Upstream face: ghost cell at C_up (Dirichlet). Downstream face: zero
// gradient, advective flux of the last cell only.
TransportResult transport_1d(const std::vector<double>& C,
                             double C_up,
                             const TransportCoefficients& coef,
                             const Grid1D& grid);

// d(dC_j)/dC_{j-1}, d(dC_j)/dC_j, d(dC_j)/dC_{j+1} of transport_1d.
// The operator is linear, so these do not depend on C.
struct TransportStencil {
  std::vector<double> lower;  // [n_cells], lower[0] unused
  std::vector<double> diag;   // [n_cells]
  std::vector<double> upper;  // [n_cells], upper[n-1] unused
};

TransportStencil transport_stencil(const TransportCoefficients& coef, const Grid1D& grid);

} // namespace aquifer
