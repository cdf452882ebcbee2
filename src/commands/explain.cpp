#include "commands/explain.hpp"
#include "commands/CommandUtil.hpp"

#include "io/JsonIO.hpp"
#include "prereq/CourseAstAssembler.hpp"

#include <iostream>
#include <string>

static int explain_usage() {
    std::cerr
        << "usage:\n"
        << "  course-prereqs explain \"<prerequisite text>\" [--concurrent \"<text>\"]\n";
    return 1;
}

int cmd_explain(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]).rfind("--", 0) == 0) return explain_usage();

    const std::string text = argv[1];
    const std::string concurrent = get_arg(argc, argv, "--concurrent", "");

    const prereq::CourseAstAssembler assembler;
    const prereq::PrerequisiteAst ast = assembler.assemble(text, concurrent);

    std::cout << "prerequisites: " << prereq::to_string(ast.prerequisites) << "\n";
    std::cout << "corequisites:  " << prereq::to_string(ast.corequisites) << "\n";
    std::cout << astToJson(ast).dump(2) << "\n";
    return 0;
}
