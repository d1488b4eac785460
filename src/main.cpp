#include <aquifer/budget.hpp>
#include <aquifer/config.hpp>
#include <aquifer/errors.hpp>
#include <aquifer/grid.hpp>
#include <aquifer/io.hpp>
#include <aquifer/outputs.hpp>
#include <aquifer/steady.hpp>
#include <aquifer/verify.hpp>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#ifdef AQUIFER_HAS_OPENMP
#include <omp.h>
#endif

namespace {

void print_usage() {
  std::cout << "aquifer (steady 1D advection-dispersion-reaction of DON, O2, NO3, NH3, N2)\n"
            << "Usage:\n"
            << "  aquifer --config <path/to/config.ini>\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    std::string cfg_path;
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--config" && i + 1 < argc) {
        cfg_path = argv[++i];
      } else if (a == "-h" || a == "--help") {
        print_usage();
        return 0;
      } else {
        std::cerr << "Unknown argument: " << a << "\n";
        print_usage();
        return 2;
      }
    }
    if (cfg_path.empty()) {
      print_usage();
      return 2;
    }

    aquifer::AquiferConfig cfg = aquifer::load_config(cfg_path);
    if (cfg.verbosity >= 2) cfg.solver.log = &std::cout;

#ifdef AQUIFER_HAS_OPENMP
    if (cfg.omp_threads > 0) {
      omp_set_num_threads(cfg.omp_threads);
    }
#endif

    // Create output root, copy config
    aquifer::ensure_dir(cfg.output_dir);
    aquifer::copy_file(cfg_path, (std::filesystem::path(cfg.output_dir) / "config_used.ini").string());

    aquifer::Grid1D grid(cfg.n_cells, cfg.L);

    aquifer::SteadyState sol;
    try {
      sol = aquifer::solve_steady(cfg.params, grid, cfg.solver);
    } catch (const aquifer::NonConvergenceError& e) {
      std::cerr << "[solver] " << e.what() << "\n"
                << "[solver] try a larger [solver] max_iter or a smaller pseudo_dt0\n";
      return 4;
    }

    if (cfg.verbosity >= 1) {
      std::cout << "[solver] converged in " << sol.iterations << " iterations, max residual "
                << sol.residual << "\n";
    }

    aquifer::Budget budget = aquifer::aggregate_budget(sol);
    if (cfg.verbosity >= 1) {
      for (const auto& [name, v] : aquifer::budget_fields(budget)) {
        std::cout << "[budget] " << name << " = " << v << "\n";
      }
    }

    aquifer::VerificationReport rep;
    if (cfg.verify) {
      rep = aquifer::verify_steady(cfg, grid, sol);
      std::cout << "[verify] max residual: " << rep.max_residual
                << " (ok=" << (rep.residual_ok ? "true" : "false") << ")\n";
      std::cout << "[verify] min concentration: " << rep.min_concentration
                << " (ok=" << (rep.nonnegative_ok ? "true" : "false") << ")\n";
      for (aquifer::Species s : aquifer::kAllSpecies) {
        std::cout << "[verify] balance " << aquifer::species_name(s) << ": "
                  << rep.balance_mismatch[aquifer::index_of(s)];
        if (rep.has_refinement) {
          std::cout << ", N vs 2N max diff: " << rep.refinement_diff[aquifer::index_of(s)];
        }
        std::cout << "\n";
      }
      std::cout << "[verify] balance ok=" << (rep.balance_ok ? "true" : "false") << "\n";
    }

    aquifer::write_steady_outputs(cfg, grid, sol, budget, cfg.verify ? &rep : nullptr);

    std::cout << "Done. Output in: " << cfg.output_dir << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
