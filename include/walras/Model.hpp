#pragma once
#include <walras/types.hpp>
#include <walras/Parameter.hpp>
#include <walras/Equation.hpp>
#include <walras/Firm.hpp>
#include <walras/Consumer.hpp>
#include <z3++.h>
#include <memory>
#include <vector>

namespace walras {

/** The symbolic two-firm, two-good, one-input, two-consumer production economy.
 *
 * - Firm Alpha produces X with the linear technology \f$ x = 2 z_\alpha \f$ (firm::Linear).
 * - Firm Beta produces Y with the square-root technology \f$ y = \sqrt{z_\beta} \f$
 *   (firm::Power).
 * - Consumer A owns the input endowment \f$k\f$ and so has income \f$ k p_z \f$; consumer B owns
 *   firm Beta and has its profit as income.  Both have Cobb-Douglas utility \f$ u = xy \f$.
 * - The input price \f$p_z\f$ is the numeraire, fixed to 1.
 *
 * The equilibrium system consists of the two firm optimality conditions, input market clearing
 * (\f$ k = z_\alpha + z_\beta \f$) and Y market clearing, in the four unknowns
 * \f$ p_x, p_y, z_\alpha, z_\beta \f$ (in that order).  The X market is left out of the system: by
 * Walras' Law it clears whenever the others do, which Verifier checks.
 *
 * A Model owns the Z3 context all of its expressions (and every expression derived from them) live
 * in, so it must outlive any Branch, SelectedSolution or WelfareResult computed from it.  Copies
 * share the context.
 */
class Model final {
    public:
        /** Builds the model.  This is a pure function of the fixed structural assumptions: every call
         * returns structurally identical equations, unknowns and identities, in the same order.
         */
        static Model build();

        /// The Z3 context the model's expressions belong to.
        z3::context& context() const noexcept;

        /// @{ The model parameters.
        const Parameter& px() const noexcept;
        const Parameter& py() const noexcept;
        const Parameter& pz() const noexcept;
        const Parameter& k() const noexcept;
        const Parameter& zAlpha() const noexcept;
        const Parameter& zBeta() const noexcept;
        /// @}

        /// All parameters: px, py, pz, k, z_alpha, z_beta.
        std::vector<Parameter> parameters() const;

        /// The firm producing X
        const Firm& alpha() const noexcept;
        /// The firm producing Y
        const Firm& beta() const noexcept;
        /// The consumer owning the input endowment
        const Consumer& consumerA() const noexcept;
        /// The consumer owning firm Beta
        const Consumer& consumerB() const noexcept;

        /** The equilibrium equations: alpha optimality, beta optimality, input clearing, Y
         * clearing.
         */
        const std::vector<Equation>& equations() const noexcept;

        /// The ordered unknowns \f$ [p_x, p_y, z_\alpha, z_\beta] \f$.
        z3::expr_vector unknowns() const;

        /// The domain assumptions on the free parameters: \f$ k > 0 \f$.
        z3::expr_vector assumptions() const;

        /// Returns numeric bindings setting the endowment to `k`, for evaluating results.
        Bindings bind(double k) const;

        /// @{ Market identities, as expressions over the parameters.
        /// Supply of X: \f$ 2 z_\alpha \f$
        z3::expr supplyX() const;
        /// Supply of Y: \f$ \sqrt{z_\beta} \f$
        z3::expr supplyY() const;
        /// Aggregate demand for X: \f$ x_A + x_B \f$
        z3::expr demandX() const;
        /// Aggregate demand for Y: \f$ y_A + y_B \f$
        z3::expr demandY() const;
        /// Excess demand for X: demandX() - supplyX()
        z3::expr excessDemandX() const;
        /// Excess demand for Y: demandY() - supplyY()
        z3::expr excessDemandY() const;
        /// @}

    private:
        explicit Model(const std::shared_ptr<z3::context> &ctx);

        // Must come first: everything below holds references into it.
        std::shared_ptr<z3::context> ctx_;

        Parameter px_, py_, pz_, k_, z_alpha_, z_beta_;
        std::shared_ptr<const Firm> alpha_, beta_;
        std::shared_ptr<const Consumer> consumer_a_, consumer_b_;
        std::vector<Equation> equations_;
};

}
