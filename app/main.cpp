#include "commands/explain.hpp"
#include "commands/link.hpp"
#include "commands/metadata.hpp"
#include "commands/parse.hpp"
#include "commands/run.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  course-prereqs parse [args]\n"
        << "  course-prereqs link [args]\n"
        << "  course-prereqs metadata [args]\n"
        << "  course-prereqs run [args]\n"
        << "  course-prereqs explain \"<text>\" [--concurrent \"<text>\"]\n"
        << "  course-prereqs help\n";
    return 1;
}

static int print_catalog_help(const std::string& cmd, const char* what) {
    std::cerr
        << "usage:\n"
        << "  course-prereqs " << cmd << " [options]\n"
        << "\n"
        << what << "\n"
        << "\n"
        << "options:\n"
        << "  --in <path>                  default: all_courses.json\n"
        << "  --out <path>                 default: same as --in (replaced atomically)\n"
        << "  --backup                     copy --in to <in>.backup before writing\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    const bool want_help = (argc >= 3 && std::string(argv[2]) == "--help");
    if (cmd == "parse" && want_help)
        return print_catalog_help(cmd, "attach prerequisite_ast to every course");
    if (cmd == "link" && want_help)
        return print_catalog_help(cmd, "attach is_prerequisite_for / is_corequisite_for (needs prerequisite_ast)");
    if (cmd == "metadata" && want_help)
        return print_catalog_help(cmd, "attach course_code, course_title, difficulty_level");
    if (cmd == "run" && want_help)
        return print_catalog_help(cmd, "parse + link + metadata");

    if (cmd == "parse")    return cmd_parse(argc - 1, argv + 1);
    if (cmd == "link")     return cmd_link(argc - 1, argv + 1);
    if (cmd == "metadata") return cmd_metadata(argc - 1, argv + 1);
    if (cmd == "run")      return cmd_run(argc - 1, argv + 1);
    if (cmd == "explain")  return cmd_explain(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
