#include <UnitTest++.h>

#include <cmath>
#include <limits>

#include <aquifer/errors.hpp>
#include <aquifer/grid.hpp>

using namespace aquifer;

SUITE(Grid1D)
{
  TEST(UniformCellsAndFaces)
  {
    Grid1D g(4, 2.0);
    CHECK_EQUAL(4u, g.n_cells());
    CHECK_CLOSE(0.5, g.dx(), 1e-15);
    CHECK_EQUAL(4u, g.xc().size());
    CHECK_EQUAL(5u, g.xf().size());

    CHECK_CLOSE(0.25, g.xc()[0], 1e-15);
    CHECK_CLOSE(1.75, g.xc()[3], 1e-15);
    CHECK_CLOSE(0.0, g.xf().front(), 1e-15);
    CHECK_CLOSE(2.0, g.xf().back(), 1e-15);

    for (std::size_t j = 0; j < g.n_cells(); ++j) {
      CHECK_CLOSE(g.dx(), g.xf()[j + 1] - g.xf()[j], 1e-14);
      CHECK_CLOSE(0.5 * (g.xf()[j] + g.xf()[j + 1]), g.xc()[j], 1e-14);
    }
  }

  TEST(SingleCellIsValid)
  {
    Grid1D g(1, 10.0);
    CHECK_CLOSE(10.0, g.dx(), 1e-15);
    CHECK_CLOSE(5.0, g.xc()[0], 1e-15);
  }

  TEST(ReferenceGrid)
  {
    Grid1D g(500, 500.0);
    CHECK_CLOSE(1.0, g.dx(), 1e-15);
    CHECK_CLOSE(499.5, g.xc().back(), 1e-12);
  }

  TEST(RejectsBadInput)
  {
    CHECK_THROW(Grid1D(0, 1.0), InvalidGridError);
    CHECK_THROW(Grid1D(10, 0.0), InvalidGridError);
    CHECK_THROW(Grid1D(10, -5.0), InvalidGridError);
    CHECK_THROW(Grid1D(10, std::numeric_limits<double>::quiet_NaN()), InvalidGridError);
    CHECK_THROW(Grid1D(10, std::numeric_limits<double>::infinity()), InvalidGridError);
  }
}
