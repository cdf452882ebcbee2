#pragma once
#include "catalog/CatalogPipeline.hpp"
#include "catalog/CourseRecord.hpp"

#include <string>
#include <vector>

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// --in / --out / --backup shared by the catalog commands
struct CatalogPaths {
    std::string in;
    std::string out;
    bool backup = false;
};

CatalogPaths get_catalog_paths(int argc, char** argv);

// Loads the catalog or prints "error: ..." and returns false.
bool load_catalog_or_report(const std::string& path, std::vector<catalog::CourseRecord>& records);

// Optional backup of the input, then an atomic save. Prints errors, returns false on failure.
bool save_catalog_or_report(const CatalogPaths& paths, const std::vector<catalog::CourseRecord>& records);

void print_parse_stats(const catalog::ParseStats& stats);
void print_link_stats(const catalog::LinkStats& stats);
