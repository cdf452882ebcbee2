#include "commands/run.hpp"
#include "commands/CommandUtil.hpp"

#include "catalog/CatalogPipeline.hpp"

#include <iostream>

// parse + link + metadata over one load/save
int cmd_run(int argc, char** argv) {
    const CatalogPaths paths = get_catalog_paths(argc, argv);

    std::vector<catalog::CourseRecord> records;
    if (!load_catalog_or_report(paths.in, records)) return 1;

    std::cout << "parsing prerequisites...\n";
    const catalog::ParseStats parse_stats = catalog::parse_catalog(records);

    std::cout << "building reverse prerequisite/corequisite maps...\n";
    const catalog::LinkStats link_stats = catalog::link_catalog(records);

    const int matched = catalog::annotate_titles(records);

    if (!save_catalog_or_report(paths, records)) return 1;

    print_parse_stats(parse_stats);
    print_link_stats(link_stats);
    std::cout << "METADATA matched: " << matched << "/" << records.size() << "\n";
    return 0;
}
