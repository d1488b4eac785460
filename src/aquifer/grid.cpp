#include <aquifer/grid.hpp>

#include <aquifer/errors.hpp>

#include <cmath>

namespace aquifer {

Grid1D::Grid1D(std::size_t n_cells, double length)
    : n_cells_(n_cells), length_(length) {
  if (n_cells_ < 1) {
    throw InvalidGridError("Grid1D: need at least 1 cell");
  }
  if (!(length_ > 0.0) || !std::isfinite(length_)) {
    throw InvalidGridError("Grid1D: length must be positive and finite");
  }
  dx_ = length_ / static_cast<double>(n_cells_);

  xf_.resize(n_cells_ + 1);
  for (std::size_t f = 0; f < xf_.size(); ++f) {
    xf_[f] = dx_ * static_cast<double>(f);
  }
  xf_.back() = length_;

  xc_.resize(n_cells_);
  for (std::size_t j = 0; j < n_cells_; ++j) {
    xc_[j] = (static_cast<double>(j) + 0.5) * dx_;
  }
}

} // namespace aquifer
