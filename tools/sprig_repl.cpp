#include <sprig/repl/repl.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

auto main(int argc, char** argv) -> int {
    CLI::App app{"Interactive token echo for the sprig scripting language"};

    bool verbose = false;
    bool positions = false;
    std::string prompt;
    std::string file;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("--positions", positions, "Prefix each token with its line:column");
    app.add_option("--prompt", prompt,
                   "Prompt shown before each input line. "
                   "Defaults to the SPRIG_PROMPT environment variable, then '>> '.");
    app.add_option("file", file, "Print the tokens of this file and exit");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (!file.empty()) {
        return sprig::repl::dump_file(file, positions) ? 0 : 1;
    }

    sprig::repl::ReplConfig config;
    config.verbose = verbose;
    config.show_positions = positions;
    // --prompt takes precedence over SPRIG_PROMPT.
    config.prompt = sprig::repl::resolve_prompt(prompt, std::getenv("SPRIG_PROMPT"));

    sprig::repl::run(config);

    return 0;
}
