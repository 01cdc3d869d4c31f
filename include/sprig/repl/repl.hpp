#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sprig::repl {

/// Configuration for the REPL session.
struct ReplConfig {
    bool verbose = false;
    std::string prompt = ">> ";
    /// Prefix every printed token with its `line:column`.
    bool show_positions = false;
};

/// Outcome of handing one input line to the command dispatcher.
enum class CommandResult : std::uint8_t {
    Quit,     // leave the REPL
    Handled,  // a colon command ran; its output is in the output vector
    Lex,      // not a command, scan the line as source text
};

/// Run the interactive REPL loop.
///
/// Reads lines from stdin and prints the tokens of each one, ending with EOF.
void run(const ReplConfig& config);

/// Dispatch a colon command (`:q`, `:quit`, `:exit`, `:positions`, `:load`).
///
/// Lines printed by the command are appended to `output`. `:positions`
/// updates `show_positions`. Any other line returns CommandResult::Lex and
/// leaves both arguments untouched.
[[nodiscard]] auto handle_command(std::string_view line, bool& show_positions,
                                  std::vector<std::string>& output) -> CommandResult;

/// Scan `source` with a fresh lexer and render one line per token.
///
/// The last entry is always the rendered EOF token. A lex error is rendered as
/// an `error:` line and scanning continues after the offending literal.
[[nodiscard]] auto render_tokens(std::string_view source, bool show_positions)
    -> std::vector<std::string>;

/// Read a whole file and print its tokens. Returns false when the file cannot be read.
[[nodiscard]] auto dump_file(const std::string& path, bool show_positions) -> bool;

/// Pick the prompt: an explicit `--prompt` value, then the SPRIG_PROMPT value
/// (nullptr when unset), then the ReplConfig default.
[[nodiscard]] auto resolve_prompt(std::string_view flag_value, const char* env_value)
    -> std::string;

}  // namespace sprig::repl
