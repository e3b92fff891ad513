#pragma once
#include <walras/algebra/Z3Engine.hpp>
#include <functional>
#include <vector>

// A Z3Engine with scripted answers.  If given a branch factory, solve() returns its branches
// (built in the context of the unknowns it is asked about) instead of solving; if `decides` is
// false, every truth query comes back Truth::unknown.
class StubEngine : public walras::algebra::Z3Engine {
    public:
        typedef std::function<std::vector<walras::algebra::Branch>(const z3::expr_vector&)> Factory;

        explicit StubEngine(Factory factory = nullptr, bool decides = true)
            : factory_(factory), decides_(decides) {}

        virtual std::vector<walras::algebra::Branch> solve(
                const std::vector<walras::Equation> &equations,
                const z3::expr_vector &unknowns,
                const Options &options) const override {
            solve_calls++;
            last_options = options;
            if (factory_) return factory_(unknowns);
            return Z3Engine::solve(equations, unknowns, options);
        }

        virtual walras::Truth isAlwaysTrue(const z3::expr &claim, const z3::expr_vector &assumptions) const override {
            queries++;
            if (not decides_) return walras::Truth::unknown;
            return Z3Engine::isAlwaysTrue(claim, assumptions);
        }

        mutable int solve_calls = 0;
        mutable int queries = 0;
        mutable Options last_options;

    private:
        Factory factory_;
        bool decides_;
};
