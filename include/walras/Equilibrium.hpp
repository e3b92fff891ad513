#pragma once
#include <walras/Model.hpp>
#include <walras/Selector.hpp>
#include <walras/Verifier.hpp>
#include <walras/Warning.hpp>
#include <walras/algebra/Branch.hpp>
#include <walras/algebra/Engine.hpp>
#include <vector>

namespace walras {

/** Runs the whole pipeline: builds the Model, solves it, selects the admissible solution branch,
 * then verifies market clearing and computes welfare.  Each stage runs exactly once, in that
 * order; a fatal exception from any stage propagates out of run() and nothing is returned.
 */
class Equilibrium final {
    public:
        /** Pipeline options. */
        struct Options {
            /// Default time budget for solving: unbounded
            static constexpr unsigned default_timeout_ms = 0;

            /// Time budget for solving, in milliseconds; 0 means unbounded.
            unsigned timeout_ms = default_timeout_ms;
            /// Whether a fallback branch is checked numerically; see Selector.
            bool sanity_check = Selector::default_sanity_check;
            /// The endowments a fallback branch is evaluated at.
            std::vector<double> sample_endowments = std::vector<double>(
                    Selector::default_sample_endowments.begin(), Selector::default_sample_endowments.end());
        };

        /** Everything the pipeline produces.  `model` owns the Z3 context of every other member's
         * expressions.
         */
        struct Outcome {
            /// The economy
            Model model;
            /// Every solution branch, in the order the engine enumerated them
            std::vector<algebra::Branch> branches;
            /// The selected branch
            SelectedSolution solution;
            /// Market clearing and welfare at the selected branch
            WelfareResult welfare;
            /// All warnings raised, in pipeline order
            std::vector<Warning> warnings;
        };

        /// Creates a pipeline with default options using the given engine, which must outlive it.
        explicit Equilibrium(const algebra::Engine &engine);

        /// Creates a pipeline with the given options.
        Equilibrium(const algebra::Engine &engine, const Options &options);

        /** Runs the pipeline.
         *
         * \throws Solver::no_solution, Solver::mismatch, algebra::Engine::timeout,
         * algebra::Engine::unsupported, Selector::inadmissible as raised by the stages.
         */
        Outcome run() const;

        /// The options in use
        const Options& options() const noexcept;

    private:
        const algebra::Engine &engine_;
        const Options options_;
};

}
