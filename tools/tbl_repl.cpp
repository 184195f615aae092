#include <tbl/repl/repl.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <string>

auto main(int argc, char** argv) -> int {
    CLI::App app{"tbl - interactive active-range table engine"};

    bool verbose = false;
    std::string delimiter = "|";
    std::string label_prefix;
    std::size_t max_substitutions = tbl::expr::kDefaultMaxSubstitutions;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_option("-d,--delimiter", delimiter, "Default field delimiter for :load")
        ->capture_default_str();
    app.add_option("--labels-prefix", label_prefix,
                   "Prefix of the environment variables holding column labels. "
                   "Defaults to TBL_LABEL_PREFIX, then i18n_col_.");
    auto* budget = app.add_option("--max-subst", max_substitutions,
                                  "Substitution budget for filter and select. "
                                  "Defaults to TBL_MAX_SUBST, then 100.");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    // Command-line flags take precedence over the environment.
    if (label_prefix.empty()) {
        const char* env = std::getenv("TBL_LABEL_PREFIX");
        label_prefix = env != nullptr ? env : "i18n_col_";
    }
    if (budget->count() == 0) {
        if (const char* env = std::getenv("TBL_MAX_SUBST"); env != nullptr) {
            try {
                max_substitutions = std::stoul(env);
            } catch (const std::exception& e) {
                spdlog::warn("ignoring TBL_MAX_SUBST='{}': {}", env, e.what());
            }
        }
    }

    tbl::repl::ReplConfig config;
    config.verbose = verbose;
    config.delimiter = delimiter;
    config.max_substitutions = max_substitutions;
    config.label_prefix = label_prefix;

    tbl::repl::run(config);

    return 0;
}
