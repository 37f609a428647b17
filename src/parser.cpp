#include "schedexpr/parser.hpp"
#include "schedexpr/lexer.hpp"
#include "schedexpr/token.hpp"
#include <vector>

namespace schedexpr {

static int precedence(TokKind k) {
    switch (k) {
        case TokKind::Not:       return 3;
        case TokKind::Intersect: return 2;
        case TokKind::Union:     return 1;
        default:                 return 0;
    }
}

static bool is_right_assoc(TokKind k) { return k == TokKind::Not; }

static bool is_op(TokKind k) {
    return k == TokKind::Union || k == TokKind::Intersect || k == TokKind::Not;
}

static ParseError error_at(const Token& t, const std::string& what) {
    return ParseError(what + " (at offset " + std::to_string(t.offset) + ")");
}

// Shunting-yard with function calls + commas.
// Output RPN tokens. Function calls emit Token{TokKind::Call} carrying argc.
static std::vector<Token> to_rpn(Lexer& lex) {
    std::vector<Token> output;
    std::vector<Token> opstack;

    bool expect_operand = true;

    struct CallFrame { int commas; bool saw_any_arg; };
    std::vector<CallFrame> calls;

    auto saw_operand = [&](const Token& t) {
        if (!expect_operand) throw error_at(t, std::string("Missing operator before ") + describe(t.kind));
        expect_operand = false;
        if (!calls.empty()) calls.back().saw_any_arg = true;
    };
    auto starts_operand = [&](const Token& t) {
        if (!expect_operand) throw error_at(t, std::string("Missing operator before ") + describe(t.kind));
        if (!calls.empty()) calls.back().saw_any_arg = true;
    };
    // Moves operators to the output down to the innermost '('.
    auto unwind = [&]() {
        while (!opstack.empty() && opstack.back().kind != TokKind::Open) {
            output.push_back(std::move(opstack.back()));
            opstack.pop_back();
        }
    };

    for (Token t = lex.next(); t.kind != TokKind::End; t = lex.next()) {
        switch (t.kind) {
            case TokKind::Name:
                if (lex.peek().kind == TokKind::Open) {
                    starts_operand(t);
                    t.kind = TokKind::Call;
                    opstack.push_back(std::move(t));
                    opstack.push_back(lex.next()); // '('
                    calls.push_back(CallFrame{0, false});
                    expect_operand = true;
                } else {
                    saw_operand(t);
                    output.push_back(std::move(t));
                }
                break;

            case TokKind::Integer:
                saw_operand(t);
                output.push_back(std::move(t));
                break;

            case TokKind::Open:
                starts_operand(t);
                opstack.push_back(std::move(t));
                expect_operand = true;
                break;

            case TokKind::Comma:
                if (expect_operand) throw error_at(t, "Expected expression before ','");
                unwind();
                // The '(' must open a call, not a grouping.
                if (opstack.size() < 2 || opstack[opstack.size() - 2].kind != TokKind::Call)
                    throw error_at(t, "Comma not within function call");
                calls.back().commas += 1;
                expect_operand = true;
                break;

            case TokKind::Close: {
                unwind();
                if (opstack.empty()) throw error_at(t, "Mismatched ')'");
                opstack.pop_back(); // '('

                if (!opstack.empty() && opstack.back().kind == TokKind::Call) {
                    Token fn = std::move(opstack.back());
                    opstack.pop_back();
                    CallFrame frame = calls.back();
                    calls.pop_back();

                    // "f()" is an empty call, "f(a,)" is not
                    if (expect_operand && (frame.saw_any_arg || frame.commas > 0))
                        throw error_at(t, "Expected expression before ')'");

                    fn.argc = frame.saw_any_arg ? frame.commas + 1 : 0;
                    output.push_back(std::move(fn));
                } else if (expect_operand) {
                    throw error_at(t, "Empty parentheses");
                }
                expect_operand = false;
            } break;

            case TokKind::Union:
            case TokKind::Intersect:
            case TokKind::Not: {
                if (t.kind == TokKind::Not) {
                    starts_operand(t);
                } else if (expect_operand) {
                    throw error_at(t, std::string("Expected expression before ") + describe(t.kind));
                }

                const int pcur = precedence(t.kind);
                while (!opstack.empty() && is_op(opstack.back().kind)) {
                    const int ptop = precedence(opstack.back().kind);
                    const bool pop_it = is_right_assoc(t.kind) ? (ptop > pcur) : (ptop >= pcur);
                    if (!pop_it) break;
                    output.push_back(std::move(opstack.back()));
                    opstack.pop_back();
                }
                opstack.push_back(std::move(t));
                expect_operand = true;
            } break;

            default:
                throw error_at(t, std::string("Unexpected ") + describe(t.kind) + " in expression");
        }
    }

    if (expect_operand) throw error_at(lex.peek(), "Expression is incomplete");

    while (!opstack.empty()) {
        const Token& top = opstack.back();
        if (top.kind == TokKind::Open) throw error_at(top, "Mismatched '('");
        if (top.kind == TokKind::Call) throw error_at(top, "Unclosed call to " + top.text);
        output.push_back(top);
        opstack.pop_back();
    }
    return output;
}

static Op op_for(TokKind k) {
    switch (k) {
        case TokKind::Name:      return Op::Name;
        case TokKind::Integer:   return Op::Literal;
        case TokKind::Not:       return Op::Negate;
        case TokKind::Intersect: return Op::Intersect;
        case TokKind::Union:     return Op::Unite;
        case TokKind::Call:      return Op::Apply;
        default: break;
    }
    throw ParseError(std::string("Internal error: ") + describe(k) + " in RPN output");
}

Program compile(std::string_view input) {
    Lexer lex(input);

    Token lhs = lex.next();
    if (lhs.kind != TokKind::Name) throw error_at(lhs, "Expected schedule name at start");
    Token eq = lex.next();
    if (eq.kind != TokKind::Define) throw error_at(eq, "Expected '=' after schedule name");
    if (lex.peek().kind == TokKind::End) throw error_at(lex.peek(), "Expected expression after '='");

    Program p;
    p.target = lhs.text;
    for (Token& t : to_rpn(lex)) {
        p.code.push_back(Instr{op_for(t.kind), std::move(t.text), t.value, t.argc, t.offset});
    }
    p.code.push_back(Instr{Op::Define, lhs.text, 0, 0, eq.offset});
    return p;
}

} // namespace schedexpr
