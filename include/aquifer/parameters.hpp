#pragma once

#include <aquifer/types.hpp>

namespace aquifer {

// Physical and rate constants of the aquifer model. Concentrations are in
// mmol/m^3, lengths in m, times in d. Shared read-only by every solve.
struct ParameterSet {
  double r_aeromin = 0.1;    // aerobic mineralisation [1/d]
  double r_denitr = 0.05;    // denitrification [1/d]
  double r_nitri = 0.001;    // nitrification [m^3/mmol/d]
  double r_aera = 0.02;      // aeration [1/d]

  double v_adv = 1.0;        // advective velocity [m/d]
  double a = 1.0;            // dispersivity [m]

  double kO2 = 20.0;         // O2 half-saturation / inhibition [mmol/m^3]
  double kNO3 = 10.0;        // NO3 half-saturation [mmol/m^3]

  double riverDON = 100.0;   // upstream boundary concentrations [mmol/m^3]
  double riverO2 = 300.0;
  double riverNO3 = 200.0;
  double riverNH3 = 20.0;

  double O2_sol = 300.0;     // oxygen solubility [mmol/m^3]
  double por = 0.3;          // porosity (mobile volume fraction) [-]

  // D = a * v_adv [m^2/d]
  double dispersion() const { return a * v_adv; }

  // Upstream (Dirichlet) concentration of a species; N2 enters with zero.
  double river(Species s) const;
};

// Throws InvalidParameterError naming the first offending constant.
void validate(const ParameterSet& p);

} // namespace aquifer
