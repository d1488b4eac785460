#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace aquifer {

// Fixed species order of the state vector. Slice i of a StateVector holds
// species i over all N cells, contiguous and not interleaved.
enum class Species : std::size_t {
  DON = 0,
  O2  = 1,
  NO3 = 2,
  NH3 = 3,
  N2  = 4
};

constexpr std::size_t kNumSpecies = 5;

constexpr std::array<Species, kNumSpecies> kAllSpecies = {
    Species::DON, Species::O2, Species::NO3, Species::NH3, Species::N2};

inline constexpr std::size_t index_of(Species s) { return static_cast<std::size_t>(s); }

const char* species_name(Species s);

// Concatenation [DON | O2 | NO3 | NH3 | N2], length kNumSpecies * N.
using StateVector = std::vector<double>;

struct BoundaryFluxes {
  double up = 0.0;    // flux through the upstream face x=0
  double down = 0.0;  // flux through the downstream face x=L
};

} // namespace aquifer
