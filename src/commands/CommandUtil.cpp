#include "commands/CommandUtil.hpp"
#include "io/JsonIO.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

CatalogPaths get_catalog_paths(int argc, char** argv) {
    CatalogPaths p;
    p.in = get_arg(argc, argv, "--in", "all_courses.json");
    p.out = get_arg(argc, argv, "--out", p.in);
    p.backup = has_flag(argc, argv, "--backup");
    return p;
}

bool load_catalog_or_report(const std::string& path, std::vector<catalog::CourseRecord>& records) {
    if (!fs::exists(path)) {
        std::cerr << "error: " << path << " not found (cwd: " << fs::current_path().string() << ")\n";
        return false;
    }

    std::cout << "reading " << path << "...\n";
    try {
        records = loadCatalog(path);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return false;
    }
    std::cout << "loaded " << records.size() << " courses\n";
    return true;
}

bool save_catalog_or_report(const CatalogPaths& paths, const std::vector<catalog::CourseRecord>& records) {
    if (paths.backup) {
        const std::string backup_path = paths.in + ".backup";
        std::error_code ec;
        fs::copy_file(paths.in, backup_path, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            std::cerr << "error: could not create backup " << backup_path << ": " << ec.message() << "\n";
            return false;
        }
        std::cout << "backup: " << backup_path << "\n";
    }

    try {
        saveCatalog(paths.out, records);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        std::cerr << "error: " << paths.out << " was left unchanged\n";
        return false;
    }

    std::cout << "OUT_CATALOG: " << paths.out << "\n";
    return true;
}

void print_parse_stats(const catalog::ParseStats& stats) {
    for (const auto& f : stats.failures) {
        std::cerr << "warning: failed to parse course '" << f.title << "': " << f.message << "\n";
    }

    std::cout << "\n"
              << "PARSE total:               " << stats.total << "\n"
              << "PARSE with_prerequisites:  " << stats.with_prerequisites << "\n"
              << "PARSE with_corequisites:   " << stats.with_corequisites << "\n"
              << "PARSE empty:               " << stats.empty << "\n"
              << "PARSE errors:              " << stats.errors << "\n";
}

void print_link_stats(const catalog::LinkStats& stats) {
    for (const auto& f : stats.unreadable) {
        std::cerr << "warning: ignoring unreadable prerequisite_ast of '" << f.title << "': " << f.message << "\n";
    }
    if (stats.with_ast == 0) {
        std::cerr << "warning: no course carries prerequisite_ast; run `course-prereqs parse` first\n";
    }
    if (stats.unkeyed > 0) {
        std::cerr << "warning: " << stats.unkeyed << " course(s) have no course code in their title\n";
    }

    std::cout << "\n"
              << "LINK total:                " << stats.total << "\n"
              << "LINK required_as_prereq:   " << stats.with_prereq_for << "\n"
              << "LINK required_as_coreq:    " << stats.with_coreq_for << "\n"
              << "LINK leaves:               " << stats.leaves << "\n";

    for (const auto& rc : stats.most_required) {
        std::cout << "  " << rc.course_code << " is a prerequisite for " << rc.dependents << " course(s)\n";
    }
}
