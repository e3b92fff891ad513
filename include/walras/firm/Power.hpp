#pragma once
#include <walras/Firm.hpp>
#include <boost/rational.hpp>

namespace walras { namespace firm {

/** A firm with the power production function \f$ f(z) = z^\gamma \f$ for a rational exponent
 * \f$ 0 < \gamma \leq 1 \f$.  With \f$ \gamma < 1 \f$ the firm has decreasing returns to scale and
 * earns a positive profit at its optimum; the default, \f$ \gamma = 1/2 \f$, is the square-root
 * technology \f$ y = \sqrt{z} \f$.
 *
 * The first-order condition is \f$ p \gamma z^{\gamma - 1} - p_z = 0 \f$.
 */
class Power : public Firm {
    public:
        /** Constructs a power firm with exponent `numerator/denominator`.
         *
         * \throws std::invalid_argument if the exponent is not in \f$(0, 1]\f$.
         */
        Power(const std::string &name, int numerator = 1, int denominator = 2);

        /// Returns \f$ z^\gamma \f$
        virtual z3::expr output(const z3::expr &z) const override;

        /// Returns \f$ \gamma z^{\gamma-1} \f$
        virtual z3::expr marginalProduct(const z3::expr &z) const override;

        /// The exponent \f$\gamma\f$, in lowest terms.
        const boost::rational<int>& exponent() const noexcept;

    private:
        const boost::rational<int> exponent_;
};

} }
