#pragma once

namespace aquifer {

// Stoichiometric coefficients of the reaction network.
constexpr double kRedfieldNC   = 16.0 / 106.0;  // N released per unit organic matter
constexpr double kDenitriNO3   = 4.0 / 5.0;     // NO3 consumed per unit denitrification
constexpr double kDenitriN2    = 2.0 / 5.0;     // N2 produced per unit denitrification
constexpr double kNitriO2      = 2.0;           // O2 consumed per unit nitrification

} // namespace aquifer
