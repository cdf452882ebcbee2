#include "commands/link.hpp"
#include "commands/CommandUtil.hpp"

#include "catalog/CatalogPipeline.hpp"

#include <iostream>

int cmd_link(int argc, char** argv) {
    const CatalogPaths paths = get_catalog_paths(argc, argv);

    std::vector<catalog::CourseRecord> records;
    if (!load_catalog_or_report(paths.in, records)) return 1;

    std::cout << "building reverse prerequisite/corequisite maps...\n";
    const catalog::LinkStats stats = catalog::link_catalog(records);

    if (!save_catalog_or_report(paths, records)) return 1;

    print_link_stats(stats);
    return 0;
}
