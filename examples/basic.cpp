#include <sprig/sprig.hpp>

#include <fmt/core.h>

auto main() -> int {
    const char* source = R"(
let add = fn(x, y) {
    x + y;
};
if (add(1, 2) >= 3) { return true; }
)";

    fmt::print("=== Pull one token at a time ===\n");

    sprig::lexer::Lexer lexer(source);
    while (true) {
        auto token = lexer.next_token();
        if (!token) {
            fmt::print("error: {}\n", token.error().format());
            return 1;
        }
        fmt::print("{}:{} {}\n", token->line, token->column, sprig::lexer::format_token(*token));
        if (token->kind == sprig::lexer::TokenKind::Eof) {
            break;
        }
    }

    fmt::print("\n=== Whole-buffer tokenize ===\n");

    auto tokens = sprig::lexer::tokenize("let big = 9223372036854775808;");
    if (!tokens) {
        fmt::print("error: {}\n", tokens.error().format());
    }

    return 0;
}
