#pragma once
#include <walras/Model.hpp>
#include <walras/Warning.hpp>
#include <walras/algebra/Branch.hpp>
#include <walras/algebra/Engine.hpp>
#include <Eigen/Core>
#include <array>
#include <stdexcept>
#include <vector>

namespace walras {

/** The solution branch chosen by the Selector, together with how it was chosen. */
class SelectedSolution final {
    public:
        /** Records `branch`, found at position `index` of the engine's enumeration.  `proven` says
         * whether its admissibility was proven; `warnings` are any warnings raised while selecting.
         */
        SelectedSolution(const algebra::Branch &branch, size_t index, bool proven, const std::vector<Warning> &warnings);

        /// The selected branch
        const algebra::Branch& branch() const noexcept;

        /// The 0-based position of branch() in the list of branches returned by the Solver.
        size_t index() const noexcept;

        /** True if \f$ p_y > 0 \f$ was proven for all \f$ k > 0 \f$; false if the branch is the
         * unproven fallback.
         */
        bool proven() const noexcept;

        /// Warnings raised during selection (empty unless the fallback was taken).
        const std::vector<Warning>& warnings() const noexcept;

        /// Shortcut for `branch()[unknown]`.
        z3::expr operator[](const z3::expr &unknown) const;

        /// Evaluates the branch values numerically; see algebra::Branch::evaluate.
        Eigen::VectorXd evaluate(const Bindings &b) const;

    private:
        algebra::Branch branch_;
        size_t index_;
        bool proven_;
        std::vector<Warning> warnings_;
};

/** Chooses the economically admissible solution branch.
 *
 * A branch is admissible when its \f$p_y\f$ is proven strictly positive for every \f$ k > 0 \f$.
 * Branches whose side conditions are proven unsatisfiable under the assumptions are skipped.
 * Among admissible branches the first one whose \f$ p_x, z_\alpha, z_\beta \f$ are also proven
 * positive is preferred; failing that, the first admissible one is taken.
 *
 * If no branch can be proven admissible, the first branch is used anyway, with a
 * Warning::Kind::ambiguous_positivity warning.  Unless disabled, this fallback is checked
 * numerically: every value must be finite and strictly positive at each of the sample endowments,
 * otherwise `inadmissible` is thrown.
 */
class Selector final {
    public:
        /// Whether to check fallback branches numerically, by default.
        static constexpr bool default_sanity_check = true;

        /// The endowments a fallback branch is evaluated at, by default.
        static constexpr std::array<double, 3> default_sample_endowments = {{ 1.0, 4.0, 16.0 }};

        /// Creates a selector using the default options.
        explicit Selector(const algebra::Engine &engine);

        /** Creates a selector.
         *
         * \param engine the algebra engine used to prove positivity
         * \param sanity_check whether to check a fallback branch numerically
         * \param sample_endowments the endowments used by the numerical check
         */
        Selector(const algebra::Engine &engine, bool sanity_check, const std::vector<double> &sample_endowments);

        /** Selects a branch from `branches`, as returned by the Solver for `model`.
         *
         * \throws Solver::no_solution if `branches` is empty.
         * \throws inadmissible if the fallback branch fails the numerical check.
         */
        SelectedSolution select(const Model &model, const std::vector<algebra::Branch> &branches) const;

        /** Exception thrown when a fallback branch yields a non-finite or non-positive value at a
         * sample endowment.
         */
        class inadmissible : public std::runtime_error {
            public:
                /// Constructs the exception with the given message
                explicit inadmissible(const std::string &what);
        };

    private:
        // False if the side conditions of b provably never hold under the assumptions
        bool feasible(const algebra::Branch &b, const z3::expr_vector &assumptions) const;

        // Throws inadmissible unless every value of b is finite and positive at every sample endowment
        void checkNumerically(const Model &model, const algebra::Branch &b) const;

        const algebra::Engine &engine_;
        const bool sanity_check_;
        const std::vector<double> sample_endowments_;
};

}
