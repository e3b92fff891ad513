#include <walras/Solver.hpp>
#include <walras/debug.hpp>
#include <string>

namespace walras {

Solver::no_solution::no_solution(const std::string &what) : std::runtime_error(what) {}

Solver::mismatch::mismatch(size_t equations, size_t unknowns)
    : std::logic_error("Equilibrium system has " + std::to_string(equations) + " equations but "
            + std::to_string(unknowns) + " unknowns") {}

Solver::Solver(const algebra::Engine &engine, unsigned timeout_ms) : engine_(engine), timeout_ms_(timeout_ms) {}

unsigned Solver::timeoutMs() const noexcept { return timeout_ms_; }

std::vector<algebra::Branch> Solver::solve(const Model &model) const {
    const auto &equations = model.equations();
    z3::expr_vector unknowns = model.unknowns();
    if (equations.size() != unknowns.size())
        throw mismatch(equations.size(), unknowns.size());

    algebra::Engine::Options options;
    options.conditions = true;
    options.timeout_ms = timeout_ms_;

    WALRAS_DBG("solving " << equations.size() << " equations for " << unknowns);
    std::vector<algebra::Branch> branches = engine_.solve(equations, unknowns, options);
    if (branches.empty())
        throw no_solution("No solution branch found for the equilibrium system");

    WALRAS_DBG("found " << branches.size() << " branch(es)");

    // Closed forms in k
    z3::expr_vector assumptions = model.assumptions();
    std::vector<algebra::Branch> simplified;
    for (auto &b : branches) {
        z3::expr_vector values(model.context());
        for (unsigned i = 0; i < b.size(); i++) values.push_back(engine_.simplify(b.values()[i], assumptions));
        simplified.emplace_back(b.unknowns(), values, b.conditions());
    }
    return simplified;
}

}
