#pragma once
#include <string_view>
#include "schedexpr/program.hpp"

namespace schedexpr {

// Compile a single statement: IDENT '=' EXPR
//
//   EXPR := EXPR '|' EXPR        union
//         | EXPR '&' EXPR        intersection (binds tighter than '|')
//         | '!' EXPR             negation (binds tightest)
//         | IDENT '(' [EXPR {',' EXPR}] ')'
//         | IDENT | NUMBER | '(' EXPR ')'
//
// Throws ParseError on malformed input.
Program compile(std::string_view input);

} // namespace schedexpr
