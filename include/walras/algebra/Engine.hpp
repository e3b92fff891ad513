#pragma once
#include <walras/types.hpp>
#include <walras/Equation.hpp>
#include <walras/algebra/Branch.hpp>
#include <z3++.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace walras { namespace algebra {

/** Abstract interface to a symbolic algebra engine.  The equilibrium pipeline needs exactly three
 * capabilities from it: solving a system of equations for all of its solution branches, deciding
 * whether a claim holds for every admissible value of the free symbols, and simplification.
 *
 * Keeping these behind an interface lets the model building, branch selection and verification
 * logic be tested against an engine returning canned answers.
 */
class Engine {
    public:
        /** Solving options. */
        struct Options {
            /// Whether to collect the side conditions under which each branch is valid.
            bool conditions = true;
            /// Time budget for the whole solve, in milliseconds; 0 means unbounded.
            unsigned timeout_ms = 0;
        };

        virtual ~Engine() = default;

        /** Solves `equations` for `unknowns`, returning every solution branch found (possibly none).
         * Each branch assigns a closed-form expression, in the symbols other than the unknowns, to
         * every unknown, in the order given.
         *
         * \throws unsupported if the system contains forms the engine cannot handle.
         * \throws timeout if solving exceeds `options.timeout_ms`.
         */
        virtual std::vector<Branch> solve(
                const std::vector<Equation> &equations,
                const z3::expr_vector &unknowns,
                const Options &options) const = 0;

        /** Solves with default options. */
        std::vector<Branch> solve(const std::vector<Equation> &equations, const z3::expr_vector &unknowns) const;

        /** Decides whether the boolean `claim` holds for all symbol values satisfying every
         * expression in `assumptions`.  Returns Truth::unknown when this cannot be decided.
         */
        virtual Truth isAlwaysTrue(const z3::expr &claim, const z3::expr_vector &assumptions) const = 0;

        /** Returns a simplified form of `e`, equal to `e` wherever `assumptions` hold. */
        virtual z3::expr simplify(const z3::expr &e, const z3::expr_vector &assumptions) const = 0;

        /** Decides whether `e` is identically zero under the assumptions.  The default simplifies
         * `e`, returning Truth::yes for the numeral 0, and otherwise asks isAlwaysTrue(e == 0).
         */
        virtual Truth isIdenticallyZero(const z3::expr &e, const z3::expr_vector &assumptions) const;

        /** Exception thrown when the engine cannot handle the given system: malformed input,
         * unsupported expression forms or degrees, or an underdetermined system.  This is a fatal
         * configuration error.
         */
        class unsupported : public std::runtime_error {
            public:
                /// Constructs the exception with the given message
                explicit unsupported(const std::string &what);
        };

        /** Exception thrown when solving exceeds its time budget. */
        class timeout : public std::runtime_error {
            public:
                /// Constructs the exception for the given budget
                explicit timeout(unsigned timeout_ms);
        };
};

} }
