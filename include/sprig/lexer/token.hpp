#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sprig::lexer {

/// Token kinds produced by the sprig lexer.
enum class TokenKind : std::uint8_t {
    // Delimiters
    Assign,     // =
    Comma,      // ,
    Semicolon,  // ;
    LParen,     // (
    RParen,     // )
    LBrace,     // {
    RBrace,     // }

    // Arithmetic operators
    Plus,      // +
    Minus,     // -
    Asterisk,  // *
    Slash,     // /

    // Comparison operators
    Lt,     // <
    Gt,     // >
    Bang,   // !
    Le,     // <=
    Ge,     // >=
    Eq,     // ==
    NotEq,  // !=

    // Literals and names
    Ident,
    Int,

    // Keywords
    Function,
    Let,
    True,
    False,
    If,
    Else,
    Return,

    // Special
    Illegal,
    Eof,
};

/// A single token with source location.
///
/// `lexeme` points into the buffer the lexer was constructed over; it stays
/// valid only while that buffer is alive.
struct Token {
    TokenKind kind = TokenKind::Illegal;
    std::string_view lexeme;
    /// Parsed value, set only for TokenKind::Int.
    std::int64_t int_value = 0;
    std::size_t line = 0;
    std::size_t column = 0;
};

/// Compares kind and payload. Positions are not part of token identity.
[[nodiscard]] auto operator==(const Token& lhs, const Token& rhs) -> bool;

/// Look up a reserved word. Returns std::nullopt for ordinary identifiers.
[[nodiscard]] auto lookup_keyword(std::string_view word) -> std::optional<TokenKind>;

/// Variant name of a token kind, e.g. "Let" or "NotEq".
[[nodiscard]] auto to_string(TokenKind kind) -> std::string_view;

/// Render a token with its payload: `Ident("five")`, `Int(5)`, `Semicolon`.
[[nodiscard]] auto format_token(const Token& token) -> std::string;

}  // namespace sprig::lexer
