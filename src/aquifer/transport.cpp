#include <aquifer/transport.hpp>

#include <algorithm>
#include <stdexcept>

namespace aquifer {

TransportResult transport_1d(const std::vector<double>& C,
                             double C_up,
                             const TransportCoefficients& coef,
                             const Grid1D& grid) {
  const std::size_t n = grid.n_cells();
  if (C.size() != n) {
    throw std::runtime_error("transport_1d: concentration length mismatch");
  }
  const double dx = grid.dx();
  const double VF = coef.VF;
  const double v_pos = std::max(coef.v, 0.0);
  const double v_neg = std::min(coef.v, 0.0);

  TransportResult out;
  out.flux.assign(n + 1, 0.0);

  // Upstream face: C_up acts as the ghost cell value.
  out.flux[0] = -VF * coef.D * (C[0] - C_up) / dx + VF * (v_pos * C_up + v_neg * C[0]);

  // Internal faces between j-1 and j
  for (std::size_t f = 1; f < n; ++f) {
    double diff = -VF * coef.D * (C[f] - C[f - 1]) / dx;
    double adv = VF * (v_pos * C[f - 1] + v_neg * C[f]);
    out.flux[f] = diff + adv;
  }

  // Downstream face: zero gradient, no dispersive flux.
  out.flux[n] = VF * coef.v * C[n - 1];

  out.dC.assign(n, 0.0);
  const double inv = 1.0 / (dx * VF);
  for (std::size_t j = 0; j < n; ++j) {
    out.dC[j] = -(out.flux[j + 1] - out.flux[j]) * inv;
  }

  out.flux_up = out.flux[0];
  out.flux_down = out.flux[n];
  return out;
}

TransportStencil transport_stencil(const TransportCoefficients& coef, const Grid1D& grid) {
  const std::size_t n = grid.n_cells();
  const double dx = grid.dx();
  const double v_pos = std::max(coef.v, 0.0);
  const double v_neg = std::min(coef.v, 0.0);
  const double Ddx = coef.D / dx;

  // Per unit VF: d flux_f / d C_{f-1} and d flux_f / d C_f
  const double dflux_left = Ddx + v_pos;
  const double dflux_right = -Ddx + v_neg;

  TransportStencil st;
  st.lower.assign(n, 0.0);
  st.diag.assign(n, 0.0);
  st.upper.assign(n, 0.0);

  for (std::size_t j = 0; j < n; ++j) {
    // dC_j = (flux_j - flux_{j+1}) / (dx VF)
    double d_in = dflux_right;  // flux_j w.r.t. C_j (also holds for the upstream face)
    double d_out = (j + 1 < n) ? dflux_left : coef.v;  // flux_{j+1} w.r.t. C_j
    st.diag[j] = (d_in - d_out) / dx;

    if (j > 0) st.lower[j] = dflux_left / dx;
    if (j + 1 < n) st.upper[j] = -dflux_right / dx;
  }
  return st;
}

} // namespace aquifer
