#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace aquifer {

// Simple 1D profile on a strictly increasing x grid with linear interpolation.
class Profile1D {
public:
  std::vector<double> x;     // [m]
  std::vector<double> val;   // arbitrary

  Profile1D() = default;
  Profile1D(std::vector<double> x_in, std::vector<double> v_in);

  std::size_t size() const { return x.size(); }

  // Constant extrapolation outside [x.front(), x.back()].
  double eval(double x_query) const;
};

// max_k |a.val[k] - b(a.x[k])|, b interpolated onto the nodes of a.
double max_abs_difference(const Profile1D& a, const Profile1D& b);

} // namespace aquifer
