#include <sprig/lexer/token.hpp>

#include <fmt/core.h>

#include <unordered_map>

namespace sprig::lexer {

auto operator==(const Token& lhs, const Token& rhs) -> bool {
    if (lhs.kind != rhs.kind) {
        return false;
    }
    switch (lhs.kind) {
        case TokenKind::Ident:
            return lhs.lexeme == rhs.lexeme;
        case TokenKind::Int:
            return lhs.int_value == rhs.int_value;
        default:
            return true;
    }
}

auto lookup_keyword(std::string_view word) -> std::optional<TokenKind> {
    static const std::unordered_map<std::string_view, TokenKind> keywords = {
        {"fn", TokenKind::Function}, {"let", TokenKind::Let},   {"true", TokenKind::True},
        {"false", TokenKind::False}, {"if", TokenKind::If},     {"else", TokenKind::Else},
        {"return", TokenKind::Return},
    };
    if (auto it = keywords.find(word); it != keywords.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
        case TokenKind::Assign:
            return "Assign";
        case TokenKind::Comma:
            return "Comma";
        case TokenKind::Semicolon:
            return "Semicolon";
        case TokenKind::LParen:
            return "LParen";
        case TokenKind::RParen:
            return "RParen";
        case TokenKind::LBrace:
            return "LBrace";
        case TokenKind::RBrace:
            return "RBrace";
        case TokenKind::Plus:
            return "Plus";
        case TokenKind::Minus:
            return "Minus";
        case TokenKind::Asterisk:
            return "Asterisk";
        case TokenKind::Slash:
            return "Slash";
        case TokenKind::Lt:
            return "LT";
        case TokenKind::Gt:
            return "GT";
        case TokenKind::Bang:
            return "Bang";
        case TokenKind::Le:
            return "LTE";
        case TokenKind::Ge:
            return "GTE";
        case TokenKind::Eq:
            return "Eq";
        case TokenKind::NotEq:
            return "NotEq";
        case TokenKind::Ident:
            return "Ident";
        case TokenKind::Int:
            return "Int";
        case TokenKind::Function:
            return "Function";
        case TokenKind::Let:
            return "Let";
        case TokenKind::True:
            return "True";
        case TokenKind::False:
            return "False";
        case TokenKind::If:
            return "If";
        case TokenKind::Else:
            return "Else";
        case TokenKind::Return:
            return "Return";
        case TokenKind::Illegal:
            return "Illegal";
        case TokenKind::Eof:
            return "EOF";
    }
    return "Unknown";
}

auto format_token(const Token& token) -> std::string {
    switch (token.kind) {
        case TokenKind::Ident:
            return fmt::format("Ident(\"{}\")", token.lexeme);
        case TokenKind::Int:
            return fmt::format("Int({})", token.int_value);
        default:
            return std::string(to_string(token.kind));
    }
}

}  // namespace sprig::lexer
