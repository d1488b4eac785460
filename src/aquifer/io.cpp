#include <aquifer/io.hpp>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>

#include <json-c/json.h>

namespace aquifer {

namespace fs = std::filesystem;

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  fs::create_directories(path);
}

void write_table(const std::string& path,
                 const std::vector<std::string>& columns,
                 const std::vector<std::vector<double>>& data_columns,
                 const std::string& header_comment) {
  if (columns.size() != data_columns.size()) {
    throw std::runtime_error("write_table: columns and data_columns size mismatch");
  }
  if (columns.empty()) {
    throw std::runtime_error("write_table: empty table");
  }
  std::size_t nrow = data_columns[0].size();
  for (const auto& col : data_columns) {
    if (col.size() != nrow) throw std::runtime_error("write_table: column length mismatch");
  }

  std::ofstream out(path);
  if (!out) throw std::runtime_error("Cannot write table: " + path);
  out << std::setprecision(std::numeric_limits<double>::max_digits10);

  if (!header_comment.empty()) out << "# " << header_comment << "\n";
  out << "#";
  for (const auto& c : columns) out << " " << c;
  out << "\n";

  for (std::size_t r = 0; r < nrow; ++r) {
    for (std::size_t c = 0; c < columns.size(); ++c) {
      out << data_columns[c][r];
      if (c + 1 < columns.size()) out << " ";
    }
    out << "\n";
  }
}

void write_named_values(const std::string& path,
                        const std::map<std::string, double>& values,
                        const std::string& header_comment) {
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Cannot write table: " + path);
  out << std::setprecision(std::numeric_limits<double>::max_digits10);

  if (!header_comment.empty()) out << "# " << header_comment << "\n";
  out << "# name value\n";
  for (const auto& [name, v] : values) out << name << " " << v << "\n";
}

void write_results_json(const std::string& output_dir, const ResultsIndex& idx) {
  ensure_dir(output_dir);
  std::string path = (fs::path(output_dir) / "results.json").string();

  json_object* root = json_object_new_object();
  json_object_object_add(root, "schema_version", json_object_new_string(idx.schema_version.c_str()));
  json_object_object_add(root, "aquifer_version", json_object_new_string(idx.aquifer_version.c_str()));
  json_object_object_add(root, "config_used", json_object_new_string(idx.config_used.c_str()));

  json_object* summary = json_object_new_object();
  for (const auto& [k, v] : idx.summary) {
    json_object_object_add(summary, k.c_str(), json_object_new_string(v.c_str()));
  }
  json_object_object_add(root, "summary", summary);

  json_object* budget = json_object_new_object();
  for (const auto& [k, v] : idx.budget) {
    json_object_object_add(budget, k.c_str(), json_object_new_double(v));
  }
  json_object_object_add(root, "budget", budget);

  json_object* datasets = json_object_new_object();
  for (const auto& [name, meta] : idx.datasets) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "path", json_object_new_string(meta.path.c_str()));
    json_object* cols = json_object_new_array();
    for (const auto& c : meta.columns) json_object_array_add(cols, json_object_new_string(c.c_str()));
    json_object_object_add(o, "columns", cols);
    json_object_object_add(o, "description", json_object_new_string(meta.description.c_str()));
    json_object_object_add(datasets, name.c_str(), o);
  }
  json_object_object_add(root, "datasets", datasets);

  const char* s = json_object_to_json_string_ext(root, JSON_C_TO_STRING_PRETTY);
  std::ofstream out(path);
  if (!out) {
    json_object_put(root);
    throw std::runtime_error("Cannot write results.json: " + path);
  }
  out << s << "\n";
  json_object_put(root);
}

void copy_file(const std::string& src, const std::string& dst) {
  std::ifstream in(src, std::ios::binary);
  if (!in) throw std::runtime_error("copy_file: cannot open src " + src);
  std::ofstream out(dst, std::ios::binary);
  if (!out) throw std::runtime_error("copy_file: cannot open dst " + dst);
  out << in.rdbuf();
}

} // namespace aquifer
