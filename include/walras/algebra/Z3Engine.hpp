#pragma once
#include <walras/algebra/Engine.hpp>
#include <array>

namespace walras { namespace algebra {

/** Engine implementation on top of Z3.
 *
 * Solving works by elimination.  Unknowns that appear under fractional powers are first replaced
 * by a root variable (\f$ u = t^d \f$, with \f$ t \geq 0 \f$ for even \f$d\f$), which makes every
 * equation rational in the unknowns.  Then, repeatedly:
 * - each remaining equation is rewritten as a single fraction and its numerator expanded; an
 *   identically-zero numerator is dropped, a nonzero constant one discards the branch;
 * - if some unknown appears linearly in some equation (trying equations in order, then unknowns in
 *   order) it is isolated and substituted into the rest;
 * - otherwise an equation involving a single unknown is solved outright: factors of the unknown
 *   that only produce roots where the equation's denominator vanishes are stripped, and the
 *   remaining polynomial of degree one or two is solved, a quadratic splitting the computation into
 *   two branches (the root with the negative square root first).
 *
 * Higher degrees, unknowns trapped inside radicals of expressions, and systems that run out of
 * equations before every unknown is solved throw Engine::unsupported.
 *
 * The truth predicate purifies radicals (see Purifier) and asks Z3's nonlinear real arithmetic
 * solver whether the negated claim is satisfiable alongside the assumptions.
 */
class Z3Engine : public Engine {
    public:
        /** Creates an engine.
         *
         * \param timeout_ms the time limit of a single isAlwaysTrue() query, in milliseconds; 0 (the
         * default) means unbounded.  A query that times out returns Truth::unknown.
         */
        explicit Z3Engine(unsigned timeout_ms = 0);

        using Engine::solve;

        virtual std::vector<Branch> solve(
                const std::vector<Equation> &equations,
                const z3::expr_vector &unknowns,
                const Options &options) const override;

        virtual Truth isAlwaysTrue(const z3::expr &claim, const z3::expr_vector &assumptions) const override;

        /** Applies Z3's rewriter, then tries to recognize the result as a closed form, which is
         * returned only once isAlwaysTrue() proves it equal to the rewritten expression under the
         * assumptions.  Two forms are tried, both fitted to the values at the sample points:
         * - a constant: the expression evaluates to the same simple rational \f$c\f$ (denominator at
         *   most 10000) at every sample point of its free symbols;
         * - a monomial in its only free symbol \f$x\f$: \f$ c x^e \f$ with a rational exponent
         *   \f$ e \neq 0 \f$ (denominator at most 12) and \f$c\f$ a simple rational, or \f$ \pm
         *   \sqrt{c^2 x^{2e}} \f$ when only \f$c^2\f$ is rational.
         */
        virtual z3::expr simplify(const z3::expr &e, const z3::expr_vector &assumptions) const override;

        /// The per-query time limit given at construction.
        unsigned timeoutMs() const noexcept;

        /// The sample values simplify() binds free symbols to when looking for closed forms.
        static constexpr std::array<double, 3> sample_points = {{ 1.5, 4.0, 11.0 }};

    private:
        const unsigned timeout_ms_;
};

} }
