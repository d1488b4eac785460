#include <aquifer/kinetics.hpp>

#include <stdexcept>

namespace aquifer {

ReactionRates compute_rates(const std::vector<double>& DON,
                            const std::vector<double>& O2,
                            const std::vector<double>& NO3,
                            const std::vector<double>& NH3,
                            const ParameterSet& p) {
  const std::size_t n = DON.size();
  if (O2.size() != n || NO3.size() != n || NH3.size() != n) {
    throw std::runtime_error("compute_rates: species length mismatch");
  }

  ReactionRates r;
  r.aeroMin.resize(n);
  r.denitri.resize(n);
  r.nitri.resize(n);
  r.aeration.resize(n);

  for (std::size_t k = 0; k < n; ++k) {
    double lim_O2 = O2[k] / (O2[k] + p.kO2);
    double inh_O2 = p.kO2 / (O2[k] + p.kO2);
    double lim_NO3 = NO3[k] / (NO3[k] + p.kNO3);

    r.aeroMin[k] = p.r_aeromin * lim_O2 * DON[k];
    r.denitri[k] = p.r_denitr * lim_NO3 * inh_O2 * DON[k];
    r.nitri[k] = p.r_nitri * O2[k] * NH3[k];
    r.aeration[k] = p.r_aera * (p.O2_sol - O2[k]);
  }
  return r;
}

RatePartials rate_partials(double DON, double O2, double NO3, double NH3, const ParameterSet& p) {
  const double sO2 = O2 + p.kO2;
  const double sNO3 = NO3 + p.kNO3;
  const double lim_O2 = O2 / sO2;
  const double inh_O2 = p.kO2 / sO2;
  const double lim_NO3 = NO3 / sNO3;

  // d/dO2 [O2/(O2+k)] = k/(O2+k)^2 = -d/dO2 [k/(O2+k)]
  const double dlim_O2 = p.kO2 / (sO2 * sO2);
  const double dlim_NO3 = p.kNO3 / (sNO3 * sNO3);

  RatePartials d{};
  // aeroMin
  d[0][0] = p.r_aeromin * lim_O2;
  d[0][1] = p.r_aeromin * dlim_O2 * DON;
  // denitri
  d[1][0] = p.r_denitr * lim_NO3 * inh_O2;
  d[1][1] = -p.r_denitr * lim_NO3 * dlim_O2 * DON;
  d[1][2] = p.r_denitr * dlim_NO3 * inh_O2 * DON;
  // nitri
  d[2][1] = p.r_nitri * NH3;
  d[2][3] = p.r_nitri * O2;
  // aeration
  d[3][1] = -p.r_aera;
  return d;
}

} // namespace aquifer
