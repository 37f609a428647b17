#pragma once
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace schedexpr {

struct EvalError : std::runtime_error { using std::runtime_error::runtime_error; };

enum class Op {
    Name,       // push the value bound to `text`
    Literal,    // push `number`
    Negate,     // !a
    Intersect,  // a & b
    Unite,      // a | b
    Apply,      // text(argc values)
    Define,     // bind the top of the stack to `text`
};

const char* to_string(Op op);

struct Instr {
    Op op{Op::Literal};
    std::string text{};
    long number{0};
    int argc{0};
    std::size_t offset{0}; // source offset of the token that produced it
};

/// A compiled statement "name = expr", in Reverse Polish Notation.
///
/// execute() runs it against a Backend providing:
///   Value load(std::string_view name);
///   Value literal(long x);
///   Value negate(const Value& a);
///   Value intersect(const Value& a, const Value& b);
///   Value unite(const Value& a, const Value& b);
///   Value apply(std::string_view fn, const std::vector<Value>& args);
///   void  define(std::string_view name, const Value& v);
struct Program {
    std::string target;
    std::vector<Instr> code;

    /// Throws EvalError unless every instruction finds its operands and the
    /// code ends by defining `target` with nothing left over.
    void verify() const;

    template <class Backend>
    void execute(Backend& backend) const {
        verify();

        using Value = decltype(backend.load(std::string_view{}));
        std::vector<Value> st;
        st.reserve(code.size());

        for (const auto& ins : code) {
            switch (ins.op) {
                case Op::Name:
                    st.push_back(backend.load(ins.text));
                    break;

                case Op::Literal:
                    st.push_back(backend.literal(ins.number));
                    break;

                case Op::Negate:
                    st.back() = backend.negate(st.back());
                    break;

                case Op::Intersect:
                case Op::Unite: {
                    Value rhs = std::move(st.back());
                    st.pop_back();
                    st.back() = ins.op == Op::Intersect ? backend.intersect(st.back(), rhs)
                                                        : backend.unite(st.back(), rhs);
                } break;

                case Op::Apply: {
                    auto first = st.end() - ins.argc;
                    std::vector<Value> args(std::make_move_iterator(first), std::make_move_iterator(st.end()));
                    st.erase(first, st.end());
                    st.push_back(backend.apply(ins.text, args));
                } break;

                case Op::Define:
                    backend.define(ins.text, st.back());
                    st.pop_back();
                    break;
            }
        }
    }
};

} // namespace schedexpr
