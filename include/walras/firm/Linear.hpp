#pragma once
#include <walras/Firm.hpp>

namespace walras { namespace firm {

/** A constant-returns firm with production function \f$ f(z) = a z \f$.  Under perfect competition
 * such a firm makes zero profit, so its optimality condition pins down the output price relative to
 * the input price, \f$ a p - p_z = 0 \f$, independently of the quantity produced.
 */
class Linear : public Firm {
    public:
        /** Constructs a linear firm.
         *
         * \param name the firm's name
         * \param productivity the output per unit of input, \f$a\f$.  Must be positive.
         *
         * \throws std::invalid_argument if `productivity` is not positive
         */
        Linear(const std::string &name, int productivity = 2);

        /// Returns \f$ a z \f$
        virtual z3::expr output(const z3::expr &z) const override;

        /// Returns the constant \f$ a \f$
        virtual z3::expr marginalProduct(const z3::expr &z) const override;

        /// Returns \f$ a p - p_z \f$
        virtual z3::expr optimality(const z3::expr &p, const z3::expr &z, const z3::expr &pz) const override;

        /// The productivity parameter \f$a\f$
        int productivity() const noexcept;

    private:
        const int productivity_;
};

} }
