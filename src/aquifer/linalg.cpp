#include <aquifer/linalg.hpp>

#include <aquifer/errors.hpp>

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace aquifer {

namespace {

using Pivots = std::array<std::size_t, kBlock>;

// In-place LU with partial pivoting: PA = LU, unit lower L stored below the diagonal.
bool lu_factor(Block& A, Pivots& piv) {
  for (std::size_t k = 0; k < kBlock; ++k) {
    std::size_t p = k;
    double amax = std::fabs(at(A, k, k));
    for (std::size_t r = k + 1; r < kBlock; ++r) {
      double v = std::fabs(at(A, r, k));
      if (v > amax) {
        amax = v;
        p = r;
      }
    }
    piv[k] = p;
    if (!(amax > 0.0) || !std::isfinite(amax)) return false;
    if (p != k) {
      for (std::size_t c = 0; c < kBlock; ++c) std::swap(at(A, k, c), at(A, p, c));
    }
    const double inv = 1.0 / at(A, k, k);
    for (std::size_t r = k + 1; r < kBlock; ++r) {
      double m = at(A, r, k) * inv;
      at(A, r, k) = m;
      if (m == 0.0) continue;
      for (std::size_t c = k + 1; c < kBlock; ++c) at(A, r, c) -= m * at(A, k, c);
    }
  }
  return true;
}

// Solve LU x = P b in place on b (stride 1 at offset b).
void lu_solve(const Block& LU, const Pivots& piv, double* b) {
  for (std::size_t k = 0; k < kBlock; ++k) {
    if (piv[k] != k) std::swap(b[k], b[piv[k]]);
  }
  for (std::size_t r = 1; r < kBlock; ++r) {
    double s = b[r];
    for (std::size_t c = 0; c < r; ++c) s -= at(LU, r, c) * b[c];
    b[r] = s;
  }
  for (std::size_t r = kBlock; r-- > 0;) {
    double s = b[r];
    for (std::size_t c = r + 1; c < kBlock; ++c) s -= at(LU, r, c) * b[c];
    b[r] = s / at(LU, r, r);
  }
}

// X <- (LU)^{-1} X, column by column.
void lu_solve_block(const Block& LU, const Pivots& piv, Block& X) {
  std::array<double, kBlock> col{};
  for (std::size_t c = 0; c < kBlock; ++c) {
    for (std::size_t r = 0; r < kBlock; ++r) col[r] = at(X, r, c);
    lu_solve(LU, piv, col.data());
    for (std::size_t r = 0; r < kBlock; ++r) at(X, r, c) = col[r];
  }
}

// C -= A * B
void subtract_product(Block& C, const Block& A, const Block& B) {
  for (std::size_t r = 0; r < kBlock; ++r) {
    for (std::size_t k = 0; k < kBlock; ++k) {
      double a = at(A, r, k);
      if (a == 0.0) continue;
      for (std::size_t c = 0; c < kBlock; ++c) at(C, r, c) -= a * at(B, k, c);
    }
  }
}

// y -= A * x
void subtract_product(double* y, const Block& A, const double* x) {
  for (std::size_t r = 0; r < kBlock; ++r) {
    double s = 0.0;
    for (std::size_t c = 0; c < kBlock; ++c) s += at(A, r, c) * x[c];
    y[r] -= s;
  }
}

} // namespace

BlockTridiagonal::BlockTridiagonal(std::size_t n_blocks)
    : lower_(n_blocks, Block{}), diag_(n_blocks, Block{}), upper_(n_blocks, Block{}) {}

void BlockTridiagonal::scale(double s) {
  for (auto* blocks : {&lower_, &diag_, &upper_}) {
    for (auto& b : *blocks) {
      for (double& v : b) v *= s;
    }
  }
}

void BlockTridiagonal::add_identity(double s) {
  for (auto& b : diag_) {
    for (std::size_t r = 0; r < kBlock; ++r) at(b, r, r) += s;
  }
}

bool BlockTridiagonal::all_finite() const {
  for (const auto* blocks : {&lower_, &diag_, &upper_}) {
    for (const auto& b : *blocks) {
      for (double v : b) {
        if (!std::isfinite(v)) return false;
      }
    }
  }
  return true;
}

std::vector<double> BlockTridiagonal::multiply(const std::vector<double>& x) const {
  const std::size_t n = n_blocks();
  if (x.size() != size()) {
    throw std::runtime_error("BlockTridiagonal::multiply: length mismatch");
  }
  std::vector<double> y(size(), 0.0);
  for (std::size_t j = 0; j < n; ++j) {
    double* yj = &y[j * kBlock];
    for (std::size_t r = 0; r < kBlock; ++r) {
      double s = 0.0;
      for (std::size_t c = 0; c < kBlock; ++c) {
        s += at(diag_[j], r, c) * x[j * kBlock + c];
        if (j > 0) s += at(lower_[j], r, c) * x[(j - 1) * kBlock + c];
        if (j + 1 < n) s += at(upper_[j], r, c) * x[(j + 1) * kBlock + c];
      }
      yj[r] = s;
    }
  }
  return y;
}

void block_thomas_solve(BlockTridiagonal& A, std::vector<double>& d) {
  const std::size_t n = A.n_blocks();
  if (d.size() != A.size()) {
    throw std::runtime_error("block_thomas_solve: rhs length mismatch");
  }
  if (n == 0) return;

  std::vector<Pivots> piv(n);

  // Forward elimination: D_j <- D_j - L_j D_{j-1}^{-1} U_{j-1}
  for (std::size_t j = 0; j < n; ++j) {
    if (j > 0) {
      // U_{j-1} and d_{j-1} already hold D_{j-1}^{-1} U_{j-1} and D_{j-1}^{-1} d_{j-1}.
      subtract_product(A.diag(j), A.lower(j), A.upper(j - 1));
      subtract_product(&d[j * kBlock], A.lower(j), &d[(j - 1) * kBlock]);
    }
    if (!lu_factor(A.diag(j), piv[j])) {
      throw NumericalInstabilityError("block_thomas_solve: singular diagonal block at cell " +
                                      std::to_string(j));
    }
    lu_solve(A.diag(j), piv[j], &d[j * kBlock]);
    if (j + 1 < n) lu_solve_block(A.diag(j), piv[j], A.upper(j));
  }

  // Back substitution: x_j = d_j - U_j x_{j+1}
  for (std::size_t j = n - 1; j-- > 0;) {
    subtract_product(&d[j * kBlock], A.upper(j), &d[(j + 1) * kBlock]);
  }
}

} // namespace aquifer
