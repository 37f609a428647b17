#include "schedexpr/catalog.hpp"
#include "schedexpr/lexer.hpp"
#include "schedexpr/parser.hpp"

namespace schedexpr {

const Schedule& Catalog::define(std::string_view statement) {
    Program p = compile(statement);
    p.execute(builder_);
    order_.push_back(p.target);
    return *builder_.find(p.target);
}

const Schedule& Catalog::define(std::string_view name, std::string_view expression) {
    if (name.empty()) throw ParseError("Empty schedule name");
    if (name.find('`') != std::string_view::npos) throw ParseError("Schedule name must not contain '`'");

    std::string statement;
    statement.reserve(name.size() + expression.size() + 5);
    statement += '`';
    statement += name;
    statement += "` = ";
    statement += expression;
    return define(statement);
}

const Schedule& Catalog::at(std::string_view name) const {
    const Schedule* s = builder_.find(name);
    if (s == nullptr) throw EvalError("Unknown schedule: " + std::string(name));
    return *s;
}

std::vector<std::string> Catalog::firing(const TimePoint& t, EvalContext& ctx) const {
    std::vector<Schedule> schedules;
    schedules.reserve(order_.size());
    for (const auto& name : order_) schedules.push_back(at(name));

    // One evaluation: a times() schedule referenced by several entries counts once.
    const std::vector<bool> fired = ctx.matches_each(schedules, t);

    std::vector<std::string> out;
    for (std::size_t i = 0; i < order_.size(); ++i) {
        if (fired[i]) out.push_back(order_[i]);
    }
    return out;
}

} // namespace schedexpr
