#pragma once

#include <map>
#include <string>
#include <vector>

namespace aquifer {

struct DatasetMeta {
  std::string path;                  // relative to output_dir
  std::vector<std::string> columns;  // e.g. ["x","DON"]
  std::string description;
};

struct ResultsIndex {
  std::string schema_version = "aquifer.results.v1";
  std::string aquifer_version = "0.1.0";
  std::string config_used;   // usually "config_used.ini"

  // High-level run summary (stringified to keep it simple).
  std::map<std::string, std::string> summary;

  // Budget fields, written as JSON numbers.
  std::map<std::string, double> budget;

  // Named datasets produced by this run.
  std::map<std::string, DatasetMeta> datasets;
};

void ensure_dir(const std::string& path);

// Write a whitespace table with optional header lines beginning with '#'.
void write_table(const std::string& path,
                 const std::vector<std::string>& columns,
                 const std::vector<std::vector<double>>& data_columns,
                 const std::string& header_comment = "");

// Write "name value" rows.
void write_named_values(const std::string& path,
                        const std::map<std::string, double>& values,
                        const std::string& header_comment = "");

// Write results.json in output_dir.
void write_results_json(const std::string& output_dir, const ResultsIndex& idx);

// Copy a file (overwrites).
void copy_file(const std::string& src, const std::string& dst);

} // namespace aquifer
