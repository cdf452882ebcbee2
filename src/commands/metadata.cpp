#include "commands/metadata.hpp"
#include "commands/CommandUtil.hpp"

#include "catalog/CatalogPipeline.hpp"

#include <iostream>

int cmd_metadata(int argc, char** argv) {
    const CatalogPaths paths = get_catalog_paths(argc, argv);

    std::vector<catalog::CourseRecord> records;
    if (!load_catalog_or_report(paths.in, records)) return 1;

    const int matched = catalog::annotate_titles(records);
    if (matched < static_cast<int>(records.size())) {
        std::cerr << "warning: " << (records.size() - matched) << " title(s) did not match any known format\n";
    }

    if (!save_catalog_or_report(paths, records)) return 1;

    std::cout << "METADATA matched: " << matched << "/" << records.size() << "\n";
    return 0;
}
