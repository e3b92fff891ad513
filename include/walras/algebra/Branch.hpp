#pragma once
#include <walras/types.hpp>
#include <Eigen/Core>
#include <z3++.h>
#include <ostream>

namespace walras { namespace algebra {

/** One solution branch returned by an Engine: a closed-form value for every unknown, in terms of
 * the remaining free symbols only, plus the side conditions under which the branch is valid (e.g.
 * that a root taken is non-negative).  Branches are immutable once constructed.
 */
class Branch final {
    public:
        /** Constructs a branch assigning `values[i]` to `unknowns[i]`, valid under `conditions`.
         *
         * \throws std::invalid_argument if `unknowns` and `values` differ in size.
         */
        Branch(const z3::expr_vector &unknowns, const z3::expr_vector &values, const z3::expr_vector &conditions);

        /// The unknowns, in solving order.
        const z3::expr_vector& unknowns() const noexcept;
        /// The value of each unknown, in the same order as unknowns().
        const z3::expr_vector& values() const noexcept;
        /// The side conditions (possibly empty).
        const z3::expr_vector& conditions() const noexcept;

        /// The number of unknowns assigned.
        unsigned size() const;

        /** Returns the value assigned to the given unknown.
         *
         * \throws std::out_of_range if this branch does not assign `unknown`.
         */
        z3::expr operator[](const z3::expr &unknown) const;

        /** Returns `e` with every unknown replaced by its value in this branch. */
        z3::expr substitute(const z3::expr &e) const;

        /** Evaluates every value numerically with the given symbol bindings (typically just the
         * endowment), returning them in unknowns() order.
         */
        Eigen::VectorXd evaluate(const Bindings &b) const;

    private:
        z3::expr_vector unknowns_, values_, conditions_;
};

/** Prints a branch as `{px = ..., py = ..., ...} if {conditions}`. */
std::ostream& operator<<(std::ostream &os, const Branch &b);

} }
