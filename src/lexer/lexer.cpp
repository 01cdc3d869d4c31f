#include <sprig/lexer/lexer.hpp>

#include <fmt/core.h>

#include <cctype>
#include <charconv>
#include <cstdint>
#include <system_error>
#include <utility>

namespace sprig::lexer {

namespace {

auto is_alpha(char ch) -> bool {
    const auto byte = static_cast<unsigned char>(ch);
    return byte < 0x80 && std::isalpha(byte) != 0;
}

auto is_digit(char ch) -> bool {
    return ch >= '0' && ch <= '9';
}

auto is_space(char ch) -> bool {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

/// Number of bytes taken by the character starting at `offset`.
///
/// A well-formed UTF-8 sequence counts as one character; a stray or truncated
/// byte counts on its own.
auto char_width(std::string_view input, std::size_t offset) -> std::size_t {
    const auto lead = static_cast<unsigned char>(input[offset]);
    std::size_t width = 1;
    if (lead >= 0xC2 && lead <= 0xDF) {
        width = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        width = 3;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        width = 4;
    }
    if (offset + width > input.size()) {
        return 1;
    }
    for (std::size_t i = 1; i < width; ++i) {
        if ((static_cast<unsigned char>(input[offset + i]) & 0xC0) != 0x80) {
            return 1;
        }
    }
    return width;
}

}  // namespace

auto LexError::format() const -> std::string {
    return fmt::format("{}:{}: {}", line, column, message);
}

Lexer::Lexer(std::string_view input) : input_(input) {
    read_char();
}

auto Lexer::next_token() -> LexResult {
    skip_whitespace();

    const std::size_t start = position_;
    const std::size_t line = line_;
    const std::size_t column = column_;

    if (at_end_) {
        return make_token(TokenKind::Eof, start, line, column);
    }
    if (is_alpha(ch_)) {
        return read_word();
    }
    if (is_digit(ch_)) {
        return read_int();
    }

    TokenKind kind = TokenKind::Illegal;
    switch (ch_) {
        case ',':
            kind = TokenKind::Comma;
            break;
        case ';':
            kind = TokenKind::Semicolon;
            break;
        case '(':
            kind = TokenKind::LParen;
            break;
        case ')':
            kind = TokenKind::RParen;
            break;
        case '{':
            kind = TokenKind::LBrace;
            break;
        case '}':
            kind = TokenKind::RBrace;
            break;
        case '+':
            kind = TokenKind::Plus;
            break;
        case '-':
            kind = TokenKind::Minus;
            break;
        case '*':
            kind = TokenKind::Asterisk;
            break;
        case '/':
            kind = TokenKind::Slash;
            break;
        case '<':
            kind = match_next('=') ? TokenKind::Le : TokenKind::Lt;
            break;
        case '>':
            kind = match_next('=') ? TokenKind::Ge : TokenKind::Gt;
            break;
        case '!':
            kind = match_next('=') ? TokenKind::NotEq : TokenKind::Bang;
            break;
        case '=':
            kind = match_next('=') ? TokenKind::Eq : TokenKind::Assign;
            break;
        default:
            break;
    }

    read_char();
    return make_token(kind, start, line, column);
}

void Lexer::read_char() {
    if (read_position_ > 0 && !at_end_) {
        if (ch_ == '\n') {
            line_ += 1;
            column_ = 1;
        } else {
            column_ += 1;
        }
    }

    position_ = read_position_;
    if (read_position_ >= input_.size()) {
        at_end_ = true;
        ch_ = '\0';
        return;
    }
    ch_ = input_[read_position_];
    read_position_ += char_width(input_, read_position_);
}

void Lexer::skip_whitespace() {
    while (!at_end_ && is_space(ch_)) {
        read_char();
    }
}

auto Lexer::peek_is(char expected) const -> bool {
    return read_position_ < input_.size() && input_[read_position_] == expected;
}

auto Lexer::match_next(char expected) -> bool {
    if (!peek_is(expected)) {
        return false;
    }
    read_char();
    return true;
}

auto Lexer::read_word() -> LexResult {
    const std::size_t start = position_;
    const std::size_t line = line_;
    const std::size_t column = column_;

    while (!at_end_ && (is_alpha(ch_) || ch_ == '_')) {
        read_char();
    }

    Token token = make_token(TokenKind::Ident, start, line, column);
    if (auto keyword = lookup_keyword(token.lexeme)) {
        token.kind = *keyword;
    }
    return token;
}

auto Lexer::read_int() -> LexResult {
    const std::size_t start = position_;
    const std::size_t line = line_;
    const std::size_t column = column_;

    while (!at_end_ && is_digit(ch_)) {
        read_char();
    }

    Token token = make_token(TokenKind::Int, start, line, column);
    const std::string_view digits = token.lexeme;
    std::int64_t value = 0;
    auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    // Only overflow can fail here: the run holds nothing but decimal digits.
    if (result.ec != std::errc()) {
        return std::unexpected(LexError{
            .message = fmt::format("integer literal {} does not fit in a 64-bit signed integer",
                                   digits),
            .line = line,
            .column = column,
        });
    }
    token.int_value = value;
    return token;
}

auto Lexer::make_token(TokenKind kind, std::size_t start, std::size_t line,
                       std::size_t column) const -> Token {
    return Token{
        .kind = kind,
        .lexeme = input_.substr(start, position_ - start),
        .line = line,
        .column = column,
    };
}

auto tokenize(std::string_view source) -> std::expected<std::vector<Token>, LexError> {
    std::vector<Token> tokens;
    Lexer lexer(source);
    while (true) {
        auto token = lexer.next_token();
        if (!token) {
            return std::unexpected(std::move(token.error()));
        }
        tokens.push_back(*token);
        if (token->kind == TokenKind::Eof) {
            break;
        }
    }
    return tokens;
}

}  // namespace sprig::lexer
