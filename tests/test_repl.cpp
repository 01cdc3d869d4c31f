#include <sprig/repl/repl.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using sprig::repl::CommandResult;
using sprig::repl::handle_command;
using sprig::repl::render_tokens;
using sprig::repl::resolve_prompt;

TEST_CASE("REPL renders one line per token ending with EOF") {
    REQUIRE(render_tokens("let five = 5;\n", false) ==
            std::vector<std::string>{"Let", "Ident(\"five\")", "Assign", "Int(5)", "Semicolon",
                                     "EOF"});
}

TEST_CASE("REPL renders a blank line as EOF only") {
    REQUIRE(render_tokens("", false) == std::vector<std::string>{"EOF"});
    REQUIRE(render_tokens("  \n", false) == std::vector<std::string>{"EOF"});
}

TEST_CASE("REPL prefixes tokens with positions when enabled") {
    REQUIRE(render_tokens("x != 1", true) ==
            std::vector<std::string>{"1:1: Ident(\"x\")", "1:3: NotEq", "1:6: Int(1)", "1:7: EOF"});
}

TEST_CASE("REPL reports overflowing literals and keeps scanning") {
    auto lines = render_tokens("99999999999999999999 + 1", false);
    REQUIRE(lines.size() == 4);
    REQUIRE(lines[0].starts_with("error: 1:1: integer literal 99999999999999999999"));
    REQUIRE(lines[1] == "Plus");
    REQUIRE(lines[2] == "Int(1)");
    REQUIRE(lines[3] == "EOF");
}

TEST_CASE("REPL renders illegal characters") {
    REQUIRE(render_tokens("@", false) == std::vector<std::string>{"Illegal", "EOF"});
}

TEST_CASE("REPL renders the tokens of a sample file") {
    auto path = std::filesystem::path(SPRIG_SOURCE_DIR) / "tests" / "data" / "sample.sprig";
    std::ifstream input(path);
    REQUIRE(input.good());
    std::string source((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());

    auto lines = render_tokens(source, true);
    REQUIRE(lines.size() == 74);
    REQUIRE(lines[0] == "1:1: Let");
    REQUIRE(lines[1] == "1:5: Ident(\"five\")");
    REQUIRE(lines[13] == "4:11: Function");
    REQUIRE(lines[72] == "19:9: Semicolon");
    REQUIRE(lines[73] == "20:1: EOF");

    REQUIRE(sprig::repl::dump_file(path.string(), false));
}

TEST_CASE("REPL reports a missing file") {
    auto path = std::filesystem::temp_directory_path() / "sprig_repl_test_missing.sprig";
    std::filesystem::remove(path);
    REQUIRE_FALSE(sprig::repl::dump_file(path.string(), false));
}

TEST_CASE("REPL quit commands leave the loop") {
    for (std::string_view command : {":q", ":quit", ":exit", "  :q  "}) {
        bool show_positions = false;
        std::vector<std::string> output;
        REQUIRE(handle_command(command, show_positions, output) == CommandResult::Quit);
        REQUIRE(output.empty());
    }
}

TEST_CASE("REPL passes source lines through to the lexer") {
    bool show_positions = false;
    std::vector<std::string> output;
    REQUIRE(handle_command("let x = 1;", show_positions, output) == CommandResult::Lex);
    REQUIRE(handle_command(":quitter", show_positions, output) == CommandResult::Lex);
    REQUIRE(handle_command("", show_positions, output) == CommandResult::Lex);
    REQUIRE(output.empty());
    REQUIRE_FALSE(show_positions);
}

TEST_CASE("REPL :positions toggles and sets position display") {
    bool show_positions = false;
    std::vector<std::string> output;

    REQUIRE(handle_command(":positions", show_positions, output) == CommandResult::Handled);
    REQUIRE(show_positions);
    REQUIRE(handle_command(":positions", show_positions, output) == CommandResult::Handled);
    REQUIRE_FALSE(show_positions);
    REQUIRE(handle_command(":positions on", show_positions, output) == CommandResult::Handled);
    REQUIRE(show_positions);
    REQUIRE(handle_command(":positions   on ", show_positions, output) == CommandResult::Handled);
    REQUIRE(show_positions);
    REQUIRE(handle_command(":positions off", show_positions, output) == CommandResult::Handled);
    REQUIRE_FALSE(show_positions);

    REQUIRE(output == std::vector<std::string>{"positions: on", "positions: off", "positions: on",
                                               "positions: on", "positions: off"});
}

TEST_CASE("REPL :positions rejects an unknown argument") {
    bool show_positions = true;
    std::vector<std::string> output;
    REQUIRE(handle_command(":positions maybe", show_positions, output) == CommandResult::Handled);
    REQUIRE(show_positions);
    REQUIRE(output == std::vector<std::string>{"usage: :positions [on|off]"});
}

TEST_CASE("REPL :load without a path prints usage") {
    bool show_positions = false;
    std::vector<std::string> output;
    REQUIRE(handle_command(":load", show_positions, output) == CommandResult::Handled);
    REQUIRE(handle_command(":load   ", show_positions, output) == CommandResult::Handled);
    REQUIRE(output == std::vector<std::string>{"usage: :load <file>", "usage: :load <file>"});
}

TEST_CASE("REPL :load reads a quoted path") {
    auto script_path = std::filesystem::temp_directory_path() / "sprig repl load test.sprig";
    {
        std::ofstream out(script_path);
        out << "let x = 1;\n";
        out << "x;\n";
    }

    bool show_positions = true;
    std::vector<std::string> output;
    auto command = ":load \"" + script_path.string() + "\"";
    REQUIRE(handle_command(command, show_positions, output) == CommandResult::Handled);
    REQUIRE(output == std::vector<std::string>{"1:1: Let", "1:5: Ident(\"x\")", "1:7: Assign",
                                               "1:9: Int(1)", "1:10: Semicolon",
                                               "2:1: Ident(\"x\")", "2:2: Semicolon", "3:1: EOF"});

    output.clear();
    show_positions = false;
    command = ":load '" + script_path.string() + "'";
    REQUIRE(handle_command(command, show_positions, output) == CommandResult::Handled);
    REQUIRE(output.front() == "Let");
    REQUIRE(output.back() == "EOF");

    std::filesystem::remove(script_path);
}

TEST_CASE("REPL :load reports a missing file") {
    auto path = std::filesystem::temp_directory_path() / "sprig_repl_test_missing_load.sprig";
    std::filesystem::remove(path);

    bool show_positions = false;
    std::vector<std::string> output;
    REQUIRE(handle_command(":load " + path.string(), show_positions, output) ==
            CommandResult::Handled);
    REQUIRE(output == std::vector<std::string>{"error: failed to open '" + path.string() + "'"});
}

TEST_CASE("REPL prompt prefers the flag, then the environment") {
    REQUIRE(resolve_prompt("sprig> ", "env> ") == "sprig> ");
    REQUIRE(resolve_prompt("", "env> ") == "env> ");
    REQUIRE(resolve_prompt("", "") == ">> ");
    REQUIRE(resolve_prompt("", nullptr) == ">> ");
}
