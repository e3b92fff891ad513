#pragma once
#include <walras/types.hpp>
#include <z3++.h>
#include <string>

namespace walras {

/** A named symbolic quantity of the economy: a price, an input quantity or the endowment.  Each
 * Parameter has a Domain restriction and a Role; its symbol is a Z3 real constant, except for the
 * numeraire, whose "symbol" is the numeral 1 (so that it can never appear as a free symbol in any
 * equation or result).
 *
 * Parameters are created once by Model::build() and never modified.
 */
class Parameter final {
    public:
        /** Creates a symbolic Parameter named `name` in the given context.
         *
         * \throws std::invalid_argument if `role` is Role::numeraire (use numeraire() instead)
         */
        Parameter(z3::context &ctx, const std::string &name, Domain domain, Role role);

        /** Creates the numeraire Parameter `name`, fixed to the numeral 1. */
        static Parameter numeraire(z3::context &ctx, const std::string &name);

        /// The parameter name, as it appears in printed expressions.
        const std::string& name() const noexcept;
        /// The domain restriction.
        Domain domain() const noexcept;
        /// The parameter's role in the Model.
        Role role() const noexcept;

        /** The parameter's expression: a real constant named name(), or the numeral 1 for the
         * numeraire.
         */
        const z3::expr& symbol() const noexcept;

        /** Implicit conversion to the symbol, so that Parameters can be used directly when building
         * expressions.
         */
        operator const z3::expr&() const noexcept { return symbol_; }

        /** Returns the domain constraint on this parameter: `p > 0` for positive parameters, and
         * `true` for everything else (including the numeraire).
         */
        z3::expr assumption() const;

    private:
        Parameter(const std::string &name, Domain domain, Role role, const z3::expr &symbol);

        std::string name_;
        Domain domain_;
        Role role_;
        z3::expr symbol_;
};

}
