#pragma once
#include <walras/Model.hpp>
#include <walras/algebra/Engine.hpp>
#include <stdexcept>
#include <vector>

namespace walras {

/** Solves a Model's equilibrium system symbolically, returning every solution branch the algebra
 * engine finds.  The Solver only holds a reference to the engine, which must outlive it.
 */
class Solver final {
    public:
        /** Creates a solver using the given engine.
         *
         * \param engine the algebra engine
         * \param timeout_ms the time budget of each solve, in milliseconds; 0 (the default) means
         * unbounded.
         */
        explicit Solver(const algebra::Engine &engine, unsigned timeout_ms = 0);

        /** Solves the model's equations for its unknowns (in Model::unknowns() order), with side
         * conditions.  The branches are returned in the order the engine enumerates them, each value
         * simplified by the engine under the model's assumptions.
         *
         * \throws mismatch if the model's equation and unknown counts differ.
         * \throws no_solution if the engine finds no branch at all.
         * \throws algebra::Engine::timeout if solving exceeds the time budget.
         * \throws algebra::Engine::unsupported if the engine cannot handle the system.
         */
        std::vector<algebra::Branch> solve(const Model &model) const;

        /// The time budget of each solve, in milliseconds (0 = unbounded).
        unsigned timeoutMs() const noexcept;

        /** Exception thrown when the engine returns no solution branches. */
        class no_solution : public std::runtime_error {
            public:
                /// Constructs the exception with the given message
                explicit no_solution(const std::string &what);
        };

        /** Exception thrown when a system doesn't have as many equations as unknowns. */
        class mismatch : public std::logic_error {
            public:
                /// Constructs the exception for the given counts
                mismatch(size_t equations, size_t unknowns);
        };

    private:
        const algebra::Engine &engine_;
        const unsigned timeout_ms_;
};

}
