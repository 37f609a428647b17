#include "schedexpr/program.hpp"

namespace schedexpr {

const char* to_string(Op op) {
    switch (op) {
        case Op::Name:      return "name";
        case Op::Literal:   return "literal";
        case Op::Negate:    return "'!'";
        case Op::Intersect: return "'&'";
        case Op::Unite:     return "'|'";
        case Op::Apply:     return "call";
        case Op::Define:    return "definition";
    }
    return "???";
}

// Operands consumed by an instruction.
static int pops(const Instr& ins) {
    switch (ins.op) {
        case Op::Negate:    return 1;
        case Op::Intersect:
        case Op::Unite:     return 2;
        case Op::Apply:     return ins.argc;
        case Op::Define:    return 1;
        default:            return 0;
    }
}

static EvalError bad_program(const Instr& ins, const std::string& what) {
    return EvalError(std::string(to_string(ins.op)) + " at offset " + std::to_string(ins.offset) + ": " + what);
}

void Program::verify() const {
    std::size_t depth = 0;
    bool defined = false;

    for (const auto& ins : code) {
        if (defined) throw bad_program(ins, "follows the definition of " + target);
        if (ins.op == Op::Apply && ins.argc < 0) throw bad_program(ins, "negative argument count");

        const auto need = static_cast<std::size_t>(pops(ins));
        if (depth < need) {
            throw bad_program(ins, "needs " + std::to_string(need) + " operands, " + std::to_string(depth) +
                                       " available");
        }
        depth -= need;

        if (ins.op == Op::Define) {
            if (ins.text != target) throw bad_program(ins, "defines " + ins.text + ", expected " + target);
            defined = true;
        } else {
            ++depth;
        }
    }

    if (!defined) throw EvalError("Program does not define " + target);
    if (depth != 0) throw EvalError("Program leaves " + std::to_string(depth) + " values unused");
}

} // namespace schedexpr
