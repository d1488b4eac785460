#pragma once

#include <aquifer/budget.hpp>
#include <aquifer/config.hpp>
#include <aquifer/grid.hpp>
#include <aquifer/steady.hpp>
#include <aquifer/verify.hpp>

#include <string>

namespace aquifer {

// profiles.dat, rates.dat, budget.dat and results.json under cfg.output_dir/subdir.
// report may be null when verification was skipped.
void write_steady_outputs(const AquiferConfig& cfg,
                          const Grid1D& grid,
                          const SteadyState& sol,
                          const Budget& budget,
                          const VerificationReport* report,
                          const std::string& subdir = "");

} // namespace aquifer
