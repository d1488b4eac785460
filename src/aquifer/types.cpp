#include <aquifer/types.hpp>

namespace aquifer {

const char* species_name(Species s) {
  switch (s) {
    case Species::DON: return "DON";
    case Species::O2:  return "O2";
    case Species::NO3: return "NO3";
    case Species::NH3: return "NH3";
    case Species::N2:  return "N2";
  }
  return "?";
}

} // namespace aquifer
