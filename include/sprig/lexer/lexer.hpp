#pragma once

#include <sprig/lexer/token.hpp>

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace sprig::lexer {

/// Lex error with location information.
struct LexError {
    std::string message;
    std::size_t line = 0;
    std::size_t column = 0;

    [[nodiscard]] auto format() const -> std::string;
};

/// Result type for a single scan step.
using LexResult = std::expected<Token, LexError>;

/// Pull-based scanner over a borrowed source buffer.
///
/// The lexer never copies its input: the caller must keep the buffer alive for
/// as long as the lexer or any token it produced is in use. Once the end of
/// input is reached every further call to next_token() returns Eof.
class Lexer {
   public:
    explicit Lexer(std::string_view input);

    /// Scan and return the next token.
    ///
    /// Fails only for an integer literal that does not fit in std::int64_t.
    /// The literal's digits are consumed either way, so scanning can resume.
    [[nodiscard]] auto next_token() -> LexResult;

    /// Byte offset of the character under the cursor.
    [[nodiscard]] auto position() const -> std::size_t { return position_; }

   private:
    void read_char();
    void skip_whitespace();
    [[nodiscard]] auto peek_is(char expected) const -> bool;
    auto match_next(char expected) -> bool;
    auto read_word() -> LexResult;
    auto read_int() -> LexResult;
    [[nodiscard]] auto make_token(TokenKind kind, std::size_t start, std::size_t line,
                                  std::size_t column) const -> Token;

    std::string_view input_;
    std::size_t position_ = 0;
    std::size_t read_position_ = 0;
    char ch_ = '\0';
    bool at_end_ = false;
    std::size_t line_ = 1;
    std::size_t column_ = 1;
};

/// Tokenize a whole source string, up to and including the Eof token.
///
/// Stops at the first lex error.
[[nodiscard]] auto tokenize(std::string_view source) -> std::expected<std::vector<Token>, LexError>;

}  // namespace sprig::lexer
