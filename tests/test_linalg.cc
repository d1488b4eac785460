#include <UnitTest++.h>

#include <cmath>
#include <random>
#include <vector>

#include <aquifer/errors.hpp>
#include <aquifer/linalg.hpp>

using namespace aquifer;

namespace {

// Random block-tridiagonal matrix, diagonally dominant row by row.
BlockTridiagonal random_matrix(std::size_t n, unsigned seed)
{
  std::mt19937 gen(seed);
  std::uniform_real_distribution<double> u(-1.0, 1.0);

  BlockTridiagonal A(n);
  for (std::size_t j = 0; j < n; ++j) {
    for (std::size_t r = 0; r < kBlock; ++r) {
      double row = 0.0;
      for (std::size_t c = 0; c < kBlock; ++c) {
        if (j > 0) { at(A.lower(j), r, c) = u(gen); row += std::fabs(at(A.lower(j), r, c)); }
        if (j + 1 < n) { at(A.upper(j), r, c) = u(gen); row += std::fabs(at(A.upper(j), r, c)); }
        if (c != r) { at(A.diag(j), r, c) = u(gen); row += std::fabs(at(A.diag(j), r, c)); }
      }
      at(A.diag(j), r, r) = row + 1.0;
    }
  }
  return A;
}

}  // namespace

SUITE(BlockTridiagonalSolver)
{
  TEST(SolvesDiagonallyDominantSystem)
  {
    const std::size_t n = 40;
    BlockTridiagonal A = random_matrix(n, 7u);

    std::vector<double> x(A.size());
    for (std::size_t i = 0; i < x.size(); ++i) x[i] = std::sin(0.37 * static_cast<double>(i)) + 2.0;

    std::vector<double> b = A.multiply(x);
    block_thomas_solve(A, b);

    for (std::size_t i = 0; i < x.size(); ++i) CHECK_CLOSE(x[i], b[i], 1e-10);
  }

  TEST(SingleBlockNeedsPivoting)
  {
    // Permutation-like block: zero leading entry, still non-singular.
    BlockTridiagonal A(1);
    for (std::size_t r = 0; r < kBlock; ++r) at(A.diag(0), r, (r + 1) % kBlock) = static_cast<double>(r + 1);

    std::vector<double> x = {1.0, -2.0, 3.0, -4.0, 5.0};
    std::vector<double> b = A.multiply(x);
    block_thomas_solve(A, b);
    for (std::size_t i = 0; i < kBlock; ++i) CHECK_CLOSE(x[i], b[i], 1e-14);
  }

  TEST(IdentityShiftAndScale)
  {
    BlockTridiagonal A = random_matrix(3, 11u);
    BlockTridiagonal B = A;
    B.scale(-1.0);
    B.add_identity(2.0);

    std::vector<double> x(A.size(), 1.0);
    std::vector<double> ax = A.multiply(x);
    std::vector<double> bx = B.multiply(x);
    for (std::size_t i = 0; i < x.size(); ++i) CHECK_CLOSE(2.0 - ax[i], bx[i], 1e-13);
  }

  TEST(SingularBlockIsReported)
  {
    BlockTridiagonal A(3);
    for (std::size_t j = 0; j < 3; ++j) {
      for (std::size_t r = 0; r < kBlock; ++r) at(A.diag(j), r, r) = 1.0;
    }
    at(A.diag(1), 2, 2) = 0.0;
    std::vector<double> b(A.size(), 1.0);
    CHECK_THROW(block_thomas_solve(A, b), NumericalInstabilityError);
  }

  TEST(NonFiniteEntriesDetected)
  {
    BlockTridiagonal A(2);
    CHECK(A.all_finite());
    at(A.upper(0), 1, 3) = std::nan("");
    CHECK(!A.all_finite());
  }
}
