#include <aquifer/parameters.hpp>

#include <aquifer/errors.hpp>

#include <cmath>
#include <string>

namespace aquifer {

namespace {

void require_finite(double v, const char* name) {
  if (!std::isfinite(v)) {
    throw InvalidParameterError(std::string("parameter ") + name + " must be finite");
  }
}

void require_positive(double v, const char* name) {
  require_finite(v, name);
  if (!(v > 0.0)) {
    throw InvalidParameterError(std::string("parameter ") + name + " must be > 0, got " +
                                std::to_string(v));
  }
}

void require_nonnegative(double v, const char* name) {
  require_finite(v, name);
  if (v < 0.0) {
    throw InvalidParameterError(std::string("parameter ") + name + " must be >= 0, got " +
                                std::to_string(v));
  }
}

} // namespace

double ParameterSet::river(Species s) const {
  switch (s) {
    case Species::DON: return riverDON;
    case Species::O2:  return riverO2;
    case Species::NO3: return riverNO3;
    case Species::NH3: return riverNH3;
    case Species::N2:  return 0.0;
  }
  return 0.0;
}

void validate(const ParameterSet& p) {
  require_nonnegative(p.r_aeromin, "r_aeromin");
  require_nonnegative(p.r_denitr, "r_denitr");
  require_nonnegative(p.r_nitri, "r_nitri");
  require_nonnegative(p.r_aera, "r_aera");

  // Affinities guard the Michaelis-Menten quotients at zero concentration.
  require_positive(p.kO2, "kO2");
  require_positive(p.kNO3, "kNO3");

  require_positive(p.v_adv, "v_adv");
  require_nonnegative(p.a, "a");

  require_nonnegative(p.riverDON, "riverDON");
  require_nonnegative(p.riverO2, "riverO2");
  require_nonnegative(p.riverNO3, "riverNO3");
  require_nonnegative(p.riverNH3, "riverNH3");
  require_nonnegative(p.O2_sol, "O2_sol");

  require_positive(p.por, "por");
  if (p.por > 1.0) {
    throw InvalidParameterError("parameter por must be <= 1, got " + std::to_string(p.por));
  }
}

} // namespace aquifer
