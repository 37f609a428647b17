#pragma once
#include <cstddef>
#include <string>

namespace schedexpr {

enum class TokKind {
    Name,       // identifier or `quoted name`
    Integer,

    Union,      // |
    Intersect,  // &
    Not,        // !

    Open, Close,
    Comma,
    Define,     // =
    End,

    // parser only: a Name directly followed by '('
    Call,
};

// Human readable token kind, for error messages.
const char* describe(TokKind k);

struct Token {
    TokKind kind{TokKind::End};
    std::string text{};     // Name / Call
    long value{0};          // Integer
    int argc{0};            // Call, once its ')' is seen
    std::size_t offset{0};  // where the token starts in the source
};

} // namespace schedexpr
