#include <aquifer/profile.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace aquifer {

namespace {

void require_monotonic(const std::vector<double>& x, const std::string& name) {
  if (x.empty()) {
    throw std::runtime_error(name + ": need at least 1 point");
  }
  for (std::size_t i = 1; i < x.size(); ++i) {
    if (!(x[i] > x[i - 1])) {
      throw std::runtime_error(name + ": grid must be strictly increasing");
    }
  }
}

std::size_t upper_index(const std::vector<double>& x, double xq) {
  // return i such that x[i-1] <= xq < x[i], with i in [1, n-1].
  auto it = std::upper_bound(x.begin(), x.end(), xq);
  if (it == x.begin()) return 1;
  if (it == x.end()) return x.size() - 1;
  return static_cast<std::size_t>(it - x.begin());
}

} // namespace

Profile1D::Profile1D(std::vector<double> x_in, std::vector<double> v_in)
    : x(std::move(x_in)), val(std::move(v_in)) {
  if (x.size() != val.size()) {
    throw std::runtime_error("Profile1D: x and val size mismatch");
  }
  require_monotonic(x, "Profile1D::x");
}

double Profile1D::eval(double x_query) const {
  if (x.empty()) {
    throw std::runtime_error("Profile1D::eval: empty profile");
  }
  if (x_query <= x.front()) return val.front();
  if (x_query >= x.back()) return val.back();

  std::size_t i = upper_index(x, x_query);
  std::size_t i0 = i - 1;
  std::size_t i1 = i;

  double x0 = x[i0], x1 = x[i1];
  double t = (x_query - x0) / (x1 - x0);
  return (1.0 - t) * val[i0] + t * val[i1];
}

double max_abs_difference(const Profile1D& a, const Profile1D& b) {
  double m = 0.0;
  for (std::size_t k = 0; k < a.size(); ++k) {
    m = std::max(m, std::fabs(a.val[k] - b.eval(a.x[k])));
  }
  return m;
}

} // namespace aquifer
