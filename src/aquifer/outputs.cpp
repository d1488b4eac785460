#include <aquifer/outputs.hpp>

#include <aquifer/io.hpp>

#include <filesystem>

namespace aquifer {

namespace fs = std::filesystem;

void write_steady_outputs(const AquiferConfig& cfg,
                          const Grid1D& grid,
                          const SteadyState& sol,
                          const Budget& budget,
                          const VerificationReport* report,
                          const std::string& subdir) {
  fs::path outdir(cfg.output_dir);
  if (!subdir.empty()) outdir /= subdir;
  ensure_dir(outdir.string());

  const std::vector<double>& x = grid.xc();

  // C_i(x)
  std::vector<std::string> prof_names = {"x"};
  std::vector<std::vector<double>> prof_cols = {x};
  const auto profiles = split_profiles(sol, grid);
  for (Species s : kAllSpecies) {
    prof_names.push_back(species_name(s));
    prof_cols.push_back(profiles[index_of(s)]);
  }
  write_table((outdir / "profiles.dat").string(), prof_names, prof_cols,
              "x [m], concentrations [mmol/m^3]");

  // rates(x)
  const ReactionRates& r = sol.derivative.rates;
  std::vector<std::string> rate_names = {"x", "aeroMin", "denitri", "nitri", "aeration"};
  write_table((outdir / "rates.dat").string(), rate_names,
              {x, r.aeroMin, r.denitri, r.nitri, r.aeration},
              "x [m], rates [mmol/m^3/d]");

  const auto fields = budget_fields(budget);
  write_named_values((outdir / "budget.dat").string(), fields,
                     "domain totals and boundary fluxes [mmol/m^2/d]");

  ResultsIndex idx;
  idx.config_used = "config_used.ini";
  idx.summary["L"] = std::to_string(grid.length());
  idx.summary["n_cells"] = std::to_string(grid.n_cells());
  idx.summary["converged"] = "true";
  idx.summary["iterations"] = std::to_string(sol.iterations);
  idx.summary["max_residual"] = std::to_string(sol.residual);
  idx.summary["jacobian"] = cfg.solver.jacobian;
  if (report) {
    idx.summary["verify_ok"] = report->all_ok() ? "true" : "false";
    idx.summary["min_concentration"] = std::to_string(report->min_concentration);
    for (Species s : kAllSpecies) {
      const std::string name = species_name(s);
      idx.summary["balance_mismatch_" + name] = std::to_string(report->balance_mismatch[index_of(s)]);
      if (report->has_refinement) {
        idx.summary["refinement_diff_" + name] = std::to_string(report->refinement_diff[index_of(s)]);
      }
    }
  }
  idx.budget = fields;

  idx.datasets["profiles"] = DatasetMeta{"profiles.dat", prof_names, "Steady concentration profiles"};
  idx.datasets["rates"] = DatasetMeta{"rates.dat", rate_names, "Reaction rates at steady state"};
  idx.datasets["budget"] = DatasetMeta{"budget.dat", {"name", "value"}, "Budget fields"};

  write_results_json(outdir.string(), idx);
}

} // namespace aquifer
