#include <cli/document_io.hpp>
#include <cli/linter.hpp>
#include <reporting/default_report_renderer.hpp>
#include <reporting/report_engine.hpp>

#include <cxxopts.hpp>
#include <di.hpp>
#include <fmt/format.h>

using rep_renderer_t = arazzo::DefaultReportRenderer;
using reporting_t    = arazzo::ReportEngine<rep_renderer_t>;
using linter_t       = arazzo::cli::Linter<reporting_t>;

void usage(std::string msg) {
    fmt::print("{}\nThe first positional argument must be a path to an Arazzo document\n", msg);
    exit(EXIT_SUCCESS);
}

auto parse_options(int argc, char **argv) {
    // clang-format off
    cxxopts::Options options("arazzo-lint", "Builds, checks and converts Arazzo workflow descriptions");
    options.add_options()
      ("v,verbose", "Level of output verbosity", cxxopts::value<uint16_t>()->default_value("1"))
      ("p,path", "Path to the document", cxxopts::value<std::string>())
      ("h,help", "Print help message and exit")
      ("f,format", "Input format: auto, json or yaml", cxxopts::value<std::string>()->default_value("auto"))
      ("o,output", "Write the re-emitted document to this path", cxxopts::value<std::string>())
      ("t,to", "Output format: json or yaml (defaults to the input format)", cxxopts::value<std::string>()->default_value("auto"))
    ;
    options.parse_positional({"path"});
    // clang-format on

    auto result = options.parse(argc, argv);
    if(result["help"].as<bool>())
        usage(options.help());
    if(not result.count("path"))
        usage(options.help());

    return result;
}

int main(int argc, char **argv) try {
    auto result  = parse_options(argc, argv);
    auto verbose = result["verbose"].as<uint16_t>();

    arazzo::cli::LintOptions lint_options;
    lint_options.path   = result["path"].as<std::string>();
    lint_options.format = arazzo::cli::format_from_string(result["format"].as<std::string>());
    lint_options.to     = arazzo::cli::format_from_string(result["to"].as<std::string>());
    if(result.count("output"))
        lint_options.output = result["output"].as<std::string>();

    rep_renderer_t renderer{ verbose };
    auto reporting_deps = di::Deps<rep_renderer_t>{ renderer };
    reporting_t reporting{ reporting_deps, true };

    di::Deps<reporting_t> base_deps{ reporting };
    linter_t linter{ base_deps, lint_options };

    return linter.run();
} catch(std::exception const &e) {
    fmt::print("{}\n", e.what());
    return EXIT_FAILURE;
}
