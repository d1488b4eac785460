#pragma once

#include <aquifer/parameters.hpp>
#include <aquifer/steady.hpp>

#include <cstddef>
#include <iosfwd>
#include <map>
#include <string>

namespace aquifer {

// Parsed INI as section->(key->value).
using IniSection = std::map<std::string, std::string>;
using IniMap = std::map<std::string, IniSection>;

struct AquiferConfig {
  // [general]
  double L = 500.0;                 // [m]
  std::size_t n_cells = 500;
  std::string output_dir = "out";
  int omp_threads = 0;              // 0 => leave as-is
  int verbosity = 1;                // 0 quiet, 1 summary, 2 per-iteration

  // [parameters]
  ParameterSet params;

  // [solver]
  SolverOptions solver;

  // [verify]
  bool verify = true;
  bool verify_refinement = false;   // also solve on 2N and compare profiles
  double balance_tol = 1e-6;        // relative, per species

  // Convenience: report what was parsed.
  IniMap ini_raw;
};

IniMap parse_ini(std::istream& in);
IniMap parse_ini_file(const std::string& path);

// Throws ConfigError for malformed values, InvalidParameterError for
// physically invalid constants.
AquiferConfig config_from_ini(const IniMap& ini);
AquiferConfig load_config(const std::string& ini_path);

} // namespace aquifer
