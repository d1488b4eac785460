#pragma once

#include <cstddef>
#include <vector>

namespace aquifer {

// Uniform finite-volume grid on [0, L]. Throws InvalidGridError for L <= 0 or N == 0.
class Grid1D {
public:
  Grid1D() = default;
  Grid1D(std::size_t n_cells, double length);

  std::size_t n_cells() const { return n_cells_; }
  double length() const { return length_; }
  double dx() const { return dx_; }

  // Cell centers x_j (size n_cells)
  const std::vector<double>& xc() const { return xc_; }

  // Face positions x_{j-1/2} (size n_cells+1), including 0 and length.
  const std::vector<double>& xf() const { return xf_; }

private:
  std::size_t n_cells_ = 0;
  double length_ = 0.0;
  double dx_ = 0.0;
  std::vector<double> xc_;
  std::vector<double> xf_;
};

} // namespace aquifer
