#pragma once

#include <aquifer/types.hpp>

#include <array>
#include <cstddef>
#include <vector>

namespace aquifer {

constexpr std::size_t kBlock = kNumSpecies;

// Dense kBlock x kBlock block, row-major.
using Block = std::array<double, kBlock * kBlock>;

// Block-tridiagonal matrix with n_blocks rows of kBlock x kBlock blocks.
// Unknowns are ordered cell-major: x[j*kBlock + s].
class BlockTridiagonal {
public:
  BlockTridiagonal() = default;
  explicit BlockTridiagonal(std::size_t n_blocks);

  std::size_t n_blocks() const { return diag_.size(); }
  std::size_t size() const { return diag_.size() * kBlock; }

  // Block (j, j-1); lower(0) is unused.
  Block& lower(std::size_t j) { return lower_[j]; }
  const Block& lower(std::size_t j) const { return lower_[j]; }
  // Block (j, j)
  Block& diag(std::size_t j) { return diag_[j]; }
  const Block& diag(std::size_t j) const { return diag_[j]; }
  // Block (j, j+1); upper(n-1) is unused.
  Block& upper(std::size_t j) { return upper_[j]; }
  const Block& upper(std::size_t j) const { return upper_[j]; }

  void scale(double s);
  void add_identity(double s);
  bool all_finite() const;

  std::vector<double> multiply(const std::vector<double>& x) const;

private:
  std::vector<Block> lower_;
  std::vector<Block> diag_;
  std::vector<Block> upper_;
};

inline double& at(Block& b, std::size_t r, std::size_t c) { return b[r * kBlock + c]; }
inline double at(const Block& b, std::size_t r, std::size_t c) { return b[r * kBlock + c]; }

// Solve A x = d by block Thomas elimination with partial-pivoted LU of the
// diagonal blocks. A is overwritten; d becomes the solution.
// Throws NumericalInstabilityError on a singular pivot.
void block_thomas_solve(BlockTridiagonal& A, std::vector<double>& d);

} // namespace aquifer
