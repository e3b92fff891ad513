#pragma once
#include <walras/Model.hpp>
#include <walras/Selector.hpp>
#include <walras/Warning.hpp>
#include <walras/algebra/Engine.hpp>
#include <Eigen/Core>
#include <z3++.h>
#include <vector>

namespace walras {

/** The market-clearing check and welfare figures of an equilibrium, as closed-form expressions in
 * the endowment.  Everything is simplified under the model's assumptions.
 */
class WelfareResult final {
    public:
        /// Excess demand for Y at the solution: \f$ y_A + y_B - \sqrt{z_\beta} \f$
        const z3::expr& excessDemandY() const noexcept { return excess_demand_y_; }
        /// Excess demand for X at the solution: \f$ x_A + x_B - 2 z_\alpha \f$
        const z3::expr& excessDemandX() const noexcept { return excess_demand_x_; }
        /// True if excessDemandY() was proven identically zero
        bool clearsY() const noexcept { return clears_y_; }
        /// True if excessDemandX() was proven identically zero
        bool clearsX() const noexcept { return clears_x_; }

        /// @{ Incomes of consumers A and B
        const z3::expr& incomeA() const noexcept { return income_a_; }
        const z3::expr& incomeB() const noexcept { return income_b_; }
        /// @}
        /// @{ Consumption bundles
        const z3::expr& xA() const noexcept { return x_a_; }
        const z3::expr& yA() const noexcept { return y_a_; }
        const z3::expr& xB() const noexcept { return x_b_; }
        const z3::expr& yB() const noexcept { return y_b_; }
        /// @}
        /// @{ Utilities of consumers A and B
        const z3::expr& utilityA() const noexcept { return utility_a_; }
        const z3::expr& utilityB() const noexcept { return utility_b_; }
        /// @}
        /// \f$ U_A / U_B \f$
        const z3::expr& ratio() const noexcept { return ratio_; }

        /// Market-clearing warnings raised during verification.
        const std::vector<Warning>& warnings() const noexcept { return warnings_; }

        /** Numeric values of the welfare figures at one endowment. */
        struct Figures {
            double excess_demand_y, excess_demand_x,
                   income_a, income_b,
                   x_a, y_a, x_b, y_b,
                   utility_a, utility_b,
                   ratio;
        };

        /** Evaluates every figure with the given bindings (see Model::bind()).
         *
         * \throws algebra::unbound_symbol if a figure involves a symbol not bound in `b`.
         */
        Figures evaluate(const Bindings &b) const;

    private:
        friend class Verifier;

        // Every expression starts out as 0 in the given context
        explicit WelfareResult(z3::context &ctx);

        z3::expr excess_demand_y_, excess_demand_x_;
        bool clears_y_ = false, clears_x_ = false;
        z3::expr income_a_, income_b_;
        z3::expr x_a_, y_a_, x_b_, y_b_;
        z3::expr utility_a_, utility_b_;
        z3::expr ratio_;
        std::vector<Warning> warnings_;
};

/** Verifies a selected equilibrium and computes its welfare figures.
 *
 * The Y market clearing condition is one of the equilibrium equations, so its excess demand at the
 * solution should simplify to zero; the X market is not in the system, but by Walras' Law its
 * excess demand must vanish too.  A market whose excess demand cannot be shown to vanish
 * identically gets a Warning::Kind::market_not_clearing warning and verification carries on.
 */
class Verifier final {
    public:
        /// Creates a verifier using the given engine, which must outlive it.
        explicit Verifier(const algebra::Engine &engine);

        /** Checks market clearing and computes incomes, allocations, utilities and the utility
         * ratio at `solution`.
         */
        WelfareResult verify(const Model &model, const SelectedSolution &solution) const;

        /** Returns, for each of the model's equations in order, whether \f$ lhs = rhs \f$ is proven
         * for every \f$ k > 0 \f$ once `branch` is substituted.
         */
        std::vector<Truth> closure(const Model &model, const algebra::Branch &branch) const;

        /** Returns the numeric residuals \f$ lhs - rhs \f$ of the model's equations, in order, with
         * `branch` substituted and the endowment set to `k`.
         */
        Eigen::VectorXd residuals(const Model &model, const algebra::Branch &branch, double k) const;

    private:
        // Simplifies the excess demand `excess` of market `good`, appending a warning unless it clears
        bool clears(const char *good, z3::expr &excess, const z3::expr_vector &assumptions, std::vector<Warning> &warnings) const;

        const algebra::Engine &engine_;
};

}
