#include <walras/Verifier.hpp>
#include <walras/algebra/expression.hpp>
#include <walras/debug.hpp>

namespace walras {

WelfareResult::WelfareResult(z3::context &ctx)
    : excess_demand_y_(ctx.real_val(0)), excess_demand_x_(ctx.real_val(0)),
    income_a_(ctx.real_val(0)), income_b_(ctx.real_val(0)),
    x_a_(ctx.real_val(0)), y_a_(ctx.real_val(0)), x_b_(ctx.real_val(0)), y_b_(ctx.real_val(0)),
    utility_a_(ctx.real_val(0)), utility_b_(ctx.real_val(0)),
    ratio_(ctx.real_val(0)) {}

WelfareResult::Figures WelfareResult::evaluate(const Bindings &b) const {
    auto at = [&b](const z3::expr &e) { return algebra::evaluate(e, b); };
    return Figures{
        at(excess_demand_y_), at(excess_demand_x_),
        at(income_a_), at(income_b_),
        at(x_a_), at(y_a_), at(x_b_), at(y_b_),
        at(utility_a_), at(utility_b_),
        at(ratio_)
    };
}

Verifier::Verifier(const algebra::Engine &engine) : engine_(engine) {}

bool Verifier::clears(const char *good, z3::expr &excess, const z3::expr_vector &assumptions, std::vector<Warning> &warnings) const {
    excess = engine_.simplify(excess, assumptions);
    if (engine_.isIdenticallyZero(excess, assumptions) == Truth::yes) return true;

    Warning w(Warning::Kind::market_not_clearing,
            std::string("excess demand for ") + good + " does not vanish: " + excess.to_string());
    WALRAS_WARN(w);
    warnings.push_back(w);
    return false;
}

WelfareResult Verifier::verify(const Model &model, const SelectedSolution &solution) const {
    const algebra::Branch &b = solution.branch();
    z3::expr_vector assumptions = model.assumptions();
    auto at_solution = [&](const z3::expr &e) { return engine_.simplify(b.substitute(e), assumptions); };

    WelfareResult r(model.context());

    r.excess_demand_y_ = b.substitute(model.excessDemandY());
    r.clears_y_ = clears("Y", r.excess_demand_y_, assumptions, r.warnings_);
    r.excess_demand_x_ = b.substitute(model.excessDemandX());
    r.clears_x_ = clears("X", r.excess_demand_x_, assumptions, r.warnings_);

    const Consumer &A = model.consumerA(), &B = model.consumerB();
    const Parameter &px = model.px(), &py = model.py();

    r.income_a_ = at_solution(A.income());
    r.income_b_ = at_solution(B.income());
    r.x_a_ = at_solution(A.demandX(px));
    r.y_a_ = at_solution(A.demandY(py));
    r.x_b_ = at_solution(B.demandX(px));
    r.y_b_ = at_solution(B.demandY(py));
    r.utility_a_ = at_solution(A.indirectUtility(px, py));
    r.utility_b_ = at_solution(B.indirectUtility(px, py));
    r.ratio_ = at_solution(A.indirectUtility(px, py) / B.indirectUtility(px, py));

    WALRAS_DBG("I_A = " << r.income_a_ << ", I_B = " << r.income_b_);
    WALRAS_DBG("U_A / U_B = " << r.ratio_);
    return r;
}

std::vector<Truth> Verifier::closure(const Model &model, const algebra::Branch &branch) const {
    z3::expr_vector assumptions = model.assumptions();
    std::vector<Truth> proven;
    for (auto &eq : model.equations()) {
        proven.push_back(engine_.isAlwaysTrue(branch.substitute(eq.lhs) == branch.substitute(eq.rhs), assumptions));
        WALRAS_DBG(eq.label << ": " << (proven.back() == Truth::yes ? "holds" : "not proven"));
    }
    return proven;
}

Eigen::VectorXd Verifier::residuals(const Model &model, const algebra::Branch &branch, double k) const {
    const auto &equations = model.equations();
    Bindings at = model.bind(k);
    Eigen::VectorXd r(equations.size());
    for (size_t i = 0; i < equations.size(); i++)
        r[i] = algebra::evaluate(branch.substitute(equations[i].difference()), at);
    return r;
}

}
