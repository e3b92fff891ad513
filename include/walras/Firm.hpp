#pragma once
#include <z3++.h>
#include <string>

namespace walras {

/** Namespace for all specific walras::Firm implementations. */
namespace firm {}

/** Abstract base class for a competitive firm that turns the primary input into a single output
 * good.  Everything is symbolic: the firm supplies its production function and marginal product as
 * expressions in the input quantity, and this class builds the profit function and the first-order
 * (profit-maximizing) condition from those.
 */
class Firm {
    public:
        virtual ~Firm() = default;

        /// Returns the output produced from input quantity `z`.
        virtual z3::expr output(const z3::expr &z) const = 0;

        /// Returns the derivative of output() with respect to the input, evaluated at `z`.
        virtual z3::expr marginalProduct(const z3::expr &z) const = 0;

        /** Returns the firm's profit when selling output at price `p` and buying input `z` at
         * price `pz`: \f$ p f(z) - p_z z \f$.
         */
        virtual z3::expr profit(const z3::expr &p, const z3::expr &z, const z3::expr &pz) const;

        /** Returns the left-hand side of the profit-maximization condition \f$ p f'(z) - p_z = 0
         * \f$.  For a constant-returns firm this is the zero-profit (price equals marginal cost)
         * condition, and does not involve `z` at all.
         */
        virtual z3::expr optimality(const z3::expr &p, const z3::expr &z, const z3::expr &pz) const;

        /// The firm's name, used in equation labels.
        const std::string& name() const noexcept;

    protected:
        /// Constructs a firm with the given name.
        explicit Firm(const std::string &name);

    private:
        std::string name_;
};

}
