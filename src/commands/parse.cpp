#include "commands/parse.hpp"
#include "commands/CommandUtil.hpp"

#include "catalog/CatalogPipeline.hpp"

#include <iostream>

int cmd_parse(int argc, char** argv) {
    const CatalogPaths paths = get_catalog_paths(argc, argv);

    std::vector<catalog::CourseRecord> records;
    if (!load_catalog_or_report(paths.in, records)) return 1;

    std::cout << "parsing prerequisites...\n";
    const catalog::ParseStats stats = catalog::parse_catalog(records);

    if (!save_catalog_or_report(paths, records)) return 1;

    print_parse_stats(stats);
    return 0;
}
