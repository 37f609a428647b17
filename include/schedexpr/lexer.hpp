#pragma once
#include <optional>
#include <stdexcept>
#include <string_view>
#include "schedexpr/token.hpp"

namespace schedexpr {

struct ParseError : std::runtime_error { using std::runtime_error::runtime_error; };

// Splits a schedule statement into tokens, one token of lookahead.
class Lexer {
public:
    explicit Lexer(std::string_view src) : src_(src) {}

    Token next();
    const Token& peek();

    // Offset of the next unread character.
    std::size_t position() const { return pos_; }

private:
    Token scan();
    Token scan_quoted(std::size_t start);
    Token scan_name(std::size_t start);
    Token scan_integer(std::size_t start);

    std::string_view src_;
    std::size_t pos_{0};
    std::optional<Token> ahead_;
};

} // namespace schedexpr
