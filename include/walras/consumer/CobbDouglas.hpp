#pragma once
#include <walras/Consumer.hpp>

namespace walras { namespace consumer {

/** Class for a consumer with Cobb-Douglas utility \f$ u(x, y) = x^{\alpha} y^{\beta} \f$, with
 * positive integer exponents (the default, \f$ \alpha = \beta = 1 \f$, gives \f$ u = xy \f$).  It is
 * *not* required that the exponents sum to 1.
 *
 * Demand follows from fixed expenditure shares: the consumer spends the fraction
 * \f$ \frac{\alpha}{\alpha + \beta} \f$ of income on X and the rest on Y, so
 * \f$ x = \frac{\alpha}{\alpha+\beta} \frac{I}{p_x} \f$ and
 * \f$ y = \frac{\beta}{\alpha+\beta} \frac{I}{p_y} \f$.
 */
class CobbDouglas : public Consumer {
    public:
        /** Constructs a Cobb-Douglas consumer.
         *
         * \param name the consumer's name
         * \param income the consumer's symbolic income
         * \param exp_x the exponent on X, \f$\alpha\f$
         * \param exp_y the exponent on Y, \f$\beta\f$
         *
         * \throws std::invalid_argument if either exponent is not positive
         */
        CobbDouglas(const std::string &name, const z3::expr &income, int exp_x = 1, int exp_y = 1);

        using Consumer::demandX;
        using Consumer::demandY;

        virtual z3::expr demandX(const z3::expr &px, const z3::expr &income) const override;
        virtual z3::expr demandY(const z3::expr &py, const z3::expr &income) const override;

        /// Returns \f$ x^\alpha y^\beta \f$
        virtual z3::expr utility(const z3::expr &x, const z3::expr &y) const override;

        /// The exponent on X
        int expX() const noexcept;
        /// The exponent on Y
        int expY() const noexcept;

    private:
        const int exp_x_, exp_y_;
};

} }
