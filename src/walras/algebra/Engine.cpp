#include <walras/algebra/Engine.hpp>
#include <walras/algebra/expression.hpp>

namespace walras { namespace algebra {

Engine::unsupported::unsupported(const std::string &what)
    : std::runtime_error("Unsupported system: " + what) {}

Engine::timeout::timeout(unsigned timeout_ms)
    : std::runtime_error("Solving did not finish within " + std::to_string(timeout_ms) + "ms") {}

std::vector<Branch> Engine::solve(const std::vector<Equation> &equations, const z3::expr_vector &unknowns) const {
    return solve(equations, unknowns, Options());
}

Truth Engine::isIdenticallyZero(const z3::expr &e, const z3::expr_vector &assumptions) const {
    z3::expr s = simplify(e, assumptions);
    if (is_zero_numeral(s)) return Truth::yes;
    return isAlwaysTrue(s == 0, assumptions);
}

} }
