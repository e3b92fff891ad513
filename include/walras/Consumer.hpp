#pragma once
#include <z3++.h>
#include <string>

namespace walras {

/** Namespace for all specific walras::Consumer implementations. */
namespace consumer {}

/** Base class for consumers of the two-good economy.  A consumer has a symbolic income (an
 * expression over the Model's parameters, such as the value of an endowment or the profit of an
 * owned firm), Marshallian demands for the two goods given prices and income, and a utility
 * function over the goods.
 */
class Consumer {
    public:
        virtual ~Consumer() = default;

        /** Returns the demand for good X at price `px` given income `income`. */
        virtual z3::expr demandX(const z3::expr &px, const z3::expr &income) const = 0;

        /** Returns the demand for good Y at price `py` given income `income`. */
        virtual z3::expr demandY(const z3::expr &py, const z3::expr &income) const = 0;

        /** Returns the consumer's utility of consuming `x` units of X and `y` units of Y. */
        virtual z3::expr utility(const z3::expr &x, const z3::expr &y) const = 0;

        /** Returns the demand for X at this consumer's own income(). */
        z3::expr demandX(const z3::expr &px) const;

        /** Returns the demand for Y at this consumer's own income(). */
        z3::expr demandY(const z3::expr &py) const;

        /** Returns the indirect utility: the utility of the consumer's own demands at the given
         * prices.
         */
        z3::expr indirectUtility(const z3::expr &px, const z3::expr &py) const;

        /// The consumer's symbolic income.
        const z3::expr& income() const noexcept;

        /// The consumer's name, used in labels.
        const std::string& name() const noexcept;

    protected:
        /// Constructs a consumer with the given name and income expression.
        Consumer(const std::string &name, const z3::expr &income);

    private:
        std::string name_;
        z3::expr income_;
};

}
