#include <aquifer/config.hpp>

#include <aquifer/errors.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>

namespace aquifer {

namespace {

std::string trim(const std::string& s) {
  std::size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  std::size_t j = s.size();
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
  return s.substr(i, j - i);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool parse_bool(const std::string& v) {
  std::string x = to_lower(trim(v));
  if (x == "1" || x == "true" || x == "yes" || x == "on") return true;
  if (x == "0" || x == "false" || x == "no" || x == "off") return false;
  throw ConfigError("parse_bool: invalid boolean '" + v + "'");
}

double parse_double(const std::string& v) {
  std::string x = trim(v);
  if (x.empty()) throw ConfigError("parse_double: empty");
  char* end = nullptr;
  double out = std::strtod(x.c_str(), &end);
  if (end == x.c_str() || *end != '\0') {
    throw ConfigError("parse_double: invalid number '" + v + "'");
  }
  return out;
}

std::size_t parse_size(const std::string& v) {
  double d = parse_double(v);
  if (!(d >= 0.0) || !(d < static_cast<double>(std::numeric_limits<std::size_t>::max())) ||
      d != std::floor(d)) {
    throw ConfigError("parse_size: expected a non-negative integer, got '" + v + "'");
  }
  return static_cast<std::size_t>(d);
}

int parse_int(const std::string& v) {
  double d = parse_double(v);
  if (!(d >= static_cast<double>(std::numeric_limits<int>::min())) ||
      !(d <= static_cast<double>(std::numeric_limits<int>::max())) || d != std::floor(d)) {
    throw ConfigError("parse_int: expected an integer, got '" + v + "'");
  }
  return static_cast<int>(d);
}

std::optional<std::string> get_str_opt(const IniMap& ini, const std::string& sec, const std::string& key) {
  auto sit = ini.find(sec);
  if (sit == ini.end()) return std::nullopt;
  auto kit = sit->second.find(key);
  if (kit == sit->second.end()) return std::nullopt;
  return trim(kit->second);
}

std::string get_str(const IniMap& ini, const std::string& sec, const std::string& key,
                    const std::string& def) {
  auto v = get_str_opt(ini, sec, key);
  return v ? *v : def;
}

double get_double(const IniMap& ini, const std::string& sec, const std::string& key, double def) {
  auto v = get_str_opt(ini, sec, key);
  if (!v) return def;
  try {
    return parse_double(*v);
  } catch (const ConfigError& e) {
    throw ConfigError("[" + sec + "] " + key + ": " + e.what());
  }
}

int get_int(const IniMap& ini, const std::string& sec, const std::string& key, int def) {
  auto v = get_str_opt(ini, sec, key);
  if (!v) return def;
  try {
    return parse_int(*v);
  } catch (const ConfigError& e) {
    throw ConfigError("[" + sec + "] " + key + ": " + e.what());
  }
}

std::size_t get_size(const IniMap& ini, const std::string& sec, const std::string& key, std::size_t def) {
  auto v = get_str_opt(ini, sec, key);
  if (!v) return def;
  try {
    return parse_size(*v);
  } catch (const ConfigError& e) {
    throw ConfigError("[" + sec + "] " + key + ": " + e.what());
  }
}

bool get_bool(const IniMap& ini, const std::string& sec, const std::string& key, bool def) {
  auto v = get_str_opt(ini, sec, key);
  if (!v) return def;
  try {
    return parse_bool(*v);
  } catch (const ConfigError& e) {
    throw ConfigError("[" + sec + "] " + key + ": " + e.what());
  }
}

} // namespace

IniMap parse_ini(std::istream& in) {
  IniMap ini;
  std::string current = "general"; // default if no section
  ini[current] = IniSection{};

  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;

    // Strip comments (# or ;)
    auto hash = line.find('#');
    auto semi = line.find(';');
    std::size_t cut = std::string::npos;
    if (hash != std::string::npos) cut = hash;
    if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
    if (cut != std::string::npos) line = line.substr(0, cut);

    line = trim(line);
    if (line.empty()) continue;

    if (line.front() == '[' && line.back() == ']') {
      current = trim(line.substr(1, line.size() - 2));
      if (current.empty()) {
        throw ConfigError("INI parse error: empty section at line " + std::to_string(lineno));
      }
      ini[current];
      continue;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) {
      throw ConfigError("INI parse error: expected key=value at line " + std::to_string(lineno));
    }
    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));
    if (key.empty()) {
      throw ConfigError("INI parse error: empty key at line " + std::to_string(lineno));
    }
    ini[current][key] = val;
  }

  return ini;
}

IniMap parse_ini_file(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    throw ConfigError("Cannot open config INI: " + path);
  }
  return parse_ini(f);
}

AquiferConfig config_from_ini(const IniMap& ini) {
  AquiferConfig cfg;
  cfg.ini_raw = ini;

  cfg.L = get_double(ini, "general", "L", cfg.L);
  cfg.n_cells = get_size(ini, "general", "n_cells", cfg.n_cells);
  cfg.output_dir = get_str(ini, "general", "output_dir", cfg.output_dir);
  cfg.omp_threads = get_int(ini, "general", "omp_threads", cfg.omp_threads);
  cfg.verbosity = get_int(ini, "general", "verbosity", cfg.verbosity);

  // parameters
  ParameterSet& p = cfg.params;
  p.r_aeromin = get_double(ini, "parameters", "r_aeromin", p.r_aeromin);
  p.r_denitr = get_double(ini, "parameters", "r_denitr", p.r_denitr);
  p.r_nitri = get_double(ini, "parameters", "r_nitri", p.r_nitri);
  p.r_aera = get_double(ini, "parameters", "r_aera", p.r_aera);
  p.v_adv = get_double(ini, "parameters", "v_adv", p.v_adv);
  p.a = get_double(ini, "parameters", "a", p.a);
  p.kO2 = get_double(ini, "parameters", "kO2", p.kO2);
  p.kNO3 = get_double(ini, "parameters", "kNO3", p.kNO3);
  p.riverDON = get_double(ini, "parameters", "riverDON", p.riverDON);
  p.riverO2 = get_double(ini, "parameters", "riverO2", p.riverO2);
  p.riverNO3 = get_double(ini, "parameters", "riverNO3", p.riverNO3);
  p.riverNH3 = get_double(ini, "parameters", "riverNH3", p.riverNH3);
  p.O2_sol = get_double(ini, "parameters", "O2_sol", p.O2_sol);
  p.por = get_double(ini, "parameters", "por", p.por);

  // solver
  SolverOptions& s = cfg.solver;
  s.atol = get_double(ini, "solver", "atol", s.atol);
  s.rtol = get_double(ini, "solver", "rtol", s.rtol);
  s.max_iter = get_int(ini, "solver", "max_iter", s.max_iter);
  s.jacobian = to_lower(get_str(ini, "solver", "jacobian", s.jacobian));
  s.pseudo_dt0 = get_double(ini, "solver", "pseudo_dt0", s.pseudo_dt0);
  s.pseudo_dt_max = get_double(ini, "solver", "pseudo_dt_max", s.pseudo_dt_max);
  s.pseudo_dt_growth = get_double(ini, "solver", "pseudo_dt_growth", s.pseudo_dt_growth);
  s.positivity_floor = get_double(ini, "solver", "positivity_floor", s.positivity_floor);
  s.max_stalled = get_int(ini, "solver", "max_stalled", s.max_stalled);

  // verify
  cfg.verify = get_bool(ini, "verify", "enabled", cfg.verify);
  cfg.verify_refinement = get_bool(ini, "verify", "refinement", cfg.verify_refinement);
  cfg.balance_tol = get_double(ini, "verify", "balance_tol", cfg.balance_tol);

  // basic sanity
  if (!(cfg.L > 0.0) || !std::isfinite(cfg.L)) throw ConfigError("[general] L must be positive and finite");
  if (cfg.n_cells < 1) throw ConfigError("[general] n_cells must be >= 1");
  if (cfg.verbosity < 0) throw ConfigError("[general] verbosity must be >= 0");
  if (!(s.atol > 0.0)) throw ConfigError("[solver] atol must be positive");
  if (!(s.rtol >= 0.0)) throw ConfigError("[solver] rtol must be >= 0");
  if (s.max_iter < 1) throw ConfigError("[solver] max_iter must be >= 1");
  if (s.jacobian != "analytic" && s.jacobian != "fd") {
    throw ConfigError("[solver] jacobian must be one of: analytic, fd");
  }
  if (!(s.pseudo_dt0 > 0.0) || !(s.pseudo_dt_max >= s.pseudo_dt0)) {
    throw ConfigError("[solver] need 0 < pseudo_dt0 <= pseudo_dt_max");
  }
  if (!(s.pseudo_dt_growth >= 1.0)) throw ConfigError("[solver] pseudo_dt_growth must be >= 1");
  if (!(s.positivity_floor >= 0.0) || !std::isfinite(s.positivity_floor)) {
    throw ConfigError("[solver] positivity_floor must be finite and >= 0");
  }
  if (s.max_stalled < 1) throw ConfigError("[solver] max_stalled must be >= 1");
  if (!(cfg.balance_tol > 0.0)) throw ConfigError("[verify] balance_tol must be positive");

  // Physical constants fail fast, before any solve.
  validate(p);

  return cfg;
}

AquiferConfig load_config(const std::string& ini_path) {
  return config_from_ini(parse_ini_file(ini_path));
}

} // namespace aquifer
