#include <sprig/lexer/lexer.hpp>
#include <sprig/repl/repl.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

#ifdef SPRIG_HAS_READLINE
#include <readline/history.h>
#include <readline/readline.h>
#endif

namespace sprig::repl {

namespace {

#ifdef SPRIG_HAS_READLINE
constexpr std::array<std::string_view, 5> kColonCommands = {
    ":q", ":quit", ":exit", ":positions", ":load",
};

auto colon_command_generator(const char* text, int state) -> char* {
    static std::size_t index = 0;
    static std::string prefix;
    if (state == 0) {
        index = 0;
        prefix = text != nullptr ? text : "";
    }
    while (index < kColonCommands.size()) {
        const auto command = kColonCommands[index++];
        if (command.starts_with(prefix)) {
            return ::strdup(std::string(command).c_str());
        }
    }
    return nullptr;
}

auto repl_completion(const char* text, int start, int /*end*/) -> char** {
    if (start != 0 || text == nullptr || text[0] != ':') {
        return nullptr;
    }
    rl_attempted_completion_over = 1;
    return rl_completion_matches(text, colon_command_generator);
}

void configure_line_editing() {
    rl_attempted_completion_function = repl_completion;
}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    char* raw = ::readline(prompt.c_str());
    if (raw == nullptr) {
        return false;
    }
    out.assign(raw);
    if (!out.empty()) {
        ::add_history(raw);
    }
    std::free(raw);
    return true;
}
#else
void configure_line_editing() {}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    fmt::print("{}", prompt);
    std::fflush(stdout);
    return static_cast<bool>(std::getline(std::cin, out));
}
#endif

std::string_view trim(std::string_view text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

/// Strip one pair of matching quotes around a `:load` argument.
std::string unquote_path(std::string_view arg) {
    if (arg.size() >= 2 && (arg.front() == '"' || arg.front() == '\'')) {
        auto close = arg.find(arg.front(), 1);
        if (close != std::string_view::npos) {
            return std::string(arg.substr(1, close - 1));
        }
    }
    return std::string(arg);
}

auto read_source(const std::string& path) -> std::optional<std::string> {
    std::ifstream input{path};
    if (!input) {
        return std::nullopt;
    }
    std::string source((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    spdlog::debug("loaded '{}' ({} bytes)", path, source.size());
    return source;
}

auto render_token(const lexer::Token& token, bool show_positions) -> std::string {
    if (show_positions) {
        return fmt::format("{}:{}: {}", token.line, token.column, lexer::format_token(token));
    }
    return lexer::format_token(token);
}

void print_lines(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        fmt::print("{}\n", line);
    }
}

}  // namespace

auto handle_command(std::string_view line, bool& show_positions,
                    std::vector<std::string>& output) -> CommandResult {
    line = trim(line);
    if (!line.starts_with(':')) {
        return CommandResult::Lex;
    }

    // `:name rest`: the name ends at the first blank, the rest is its argument.
    auto split = line.find_first_of(" \t");
    std::string_view name = line.substr(0, split);
    std::string_view arg = split == std::string_view::npos ? std::string_view{}
                                                           : trim(line.substr(split));

    if (name == ":q" || name == ":quit" || name == ":exit") {
        return CommandResult::Quit;
    }
    if (name == ":positions") {
        if (arg.empty()) {
            show_positions = !show_positions;
        } else if (arg == "on" || arg == "off") {
            show_positions = arg == "on";
        } else {
            output.emplace_back("usage: :positions [on|off]");
            return CommandResult::Handled;
        }
        output.push_back(fmt::format("positions: {}", show_positions ? "on" : "off"));
        return CommandResult::Handled;
    }
    if (name == ":load") {
        std::string path = unquote_path(arg);
        if (path.empty()) {
            output.emplace_back("usage: :load <file>");
            return CommandResult::Handled;
        }
        auto source = read_source(path);
        if (!source) {
            output.push_back(fmt::format("error: failed to open '{}'", path));
            return CommandResult::Handled;
        }
        auto lines = render_tokens(*source, show_positions);
        output.insert(output.end(), lines.begin(), lines.end());
        return CommandResult::Handled;
    }
    return CommandResult::Lex;
}

auto render_tokens(std::string_view source, bool show_positions) -> std::vector<std::string> {
    std::vector<std::string> lines;
    lexer::Lexer lexer(source);
    while (true) {
        auto token = lexer.next_token();
        if (!token) {
            spdlog::debug("lex error: {}", token.error().format());
            lines.push_back(fmt::format("error: {}", token.error().format()));
            continue;
        }
        lines.push_back(render_token(*token, show_positions));
        if (token->kind == lexer::TokenKind::Eof) {
            break;
        }
    }
    return lines;
}

auto dump_file(const std::string& path, bool show_positions) -> bool {
    auto source = read_source(path);
    if (!source) {
        fmt::print("error: failed to open '{}'\n", path);
        return false;
    }
    print_lines(render_tokens(*source, show_positions));
    return true;
}

auto resolve_prompt(std::string_view flag_value, const char* env_value) -> std::string {
    if (!flag_value.empty()) {
        return std::string(flag_value);
    }
    if (env_value != nullptr && env_value[0] != '\0') {
        return env_value;
    }
    return ReplConfig{}.prompt;
}

void run(const ReplConfig& config) {
    if (config.verbose) {
        spdlog::info("sprig REPL started (verbose={})", config.verbose);
    }

    bool show_positions = config.show_positions;
    configure_line_editing();

    std::string line;
    std::vector<std::string> output;
    while (true) {
        if (!read_repl_line(config.prompt, line)) {
            fmt::print("\n");
            break;
        }

        output.clear();
        auto result = handle_command(line, show_positions, output);
        if (result == CommandResult::Quit) {
            break;
        }
        if (result == CommandResult::Lex) {
            output = render_tokens(line, show_positions);
        }
        print_lines(output);
    }

    spdlog::info("sprig REPL exiting");
}

}  // namespace sprig::repl
