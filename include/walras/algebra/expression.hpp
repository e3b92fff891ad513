#pragma once
#include <walras/types.hpp>
#include <boost/rational.hpp>
#include <z3++.h>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

/** \file walras/algebra/expression.hpp free functions for manipulating real-valued Z3 expressions.
 *
 * These are the building blocks of the Z3Engine: exact powers, numerator/denominator
 * normalization, polynomial coefficient extraction, numeric evaluation and the purification of
 * radicals into polynomially-constrained variables.
 */

namespace walras {

/** Namespace for the symbolic algebra layer: the Engine interface, its Z3 implementation, solution
 * branches and expression utilities.
 */
namespace algebra {

/** Exception thrown by evaluate() when an expression contains a symbol with no bound value. */
class unbound_symbol : public std::runtime_error {
    public:
        /// Constructs the exception for the symbol named `name`.
        explicit unbound_symbol(const std::string &name);
};

/** Returns \f$ b^n \f$ built from repeated multiplication (and a single division for negative
 * `n`), so that it stays polynomial for the rewriter and the solver.  `n == 0` gives the numeral 1,
 * `n == 1` returns `base` itself.
 */
z3::expr integer_power(const z3::expr &base, long n);

/** Returns \f$ b^e \f$: integer_power() when the exponent is an integer, a Z3 power term with a
 * rational numeral exponent otherwise.
 */
z3::expr rational_power(const z3::expr &base, const boost::rational<int> &e);

/** If `e` is a rational numeral (whose numerator and denominator fit in a long long), stores it in
 * `value` and returns true; otherwise returns false.
 */
bool numeral_value(const z3::expr &e, boost::rational<long long> &value);

/// Returns true if `e` is the numeral 0.
bool is_zero_numeral(const z3::expr &e);

/// Returns true if `e` is the numeral 1.
bool is_one_numeral(const z3::expr &e);

/// Returns true if `var` occurs anywhere in `e`.
bool occurs(const z3::expr &e, const z3::expr &var);

/** Returns the free symbols (uninterpreted constants) of `e`, each once, in order of first
 * appearance.
 */
std::vector<z3::expr> free_symbols(const z3::expr &e);

/** Returns the given arithmetic or boolean application `e` rebuilt with new arguments.  Used when
 * rewriting expressions bottom-up.
 */
z3::expr rebuild(const z3::expr &e, const std::vector<z3::expr> &args);

/** A rational expression split into numerator and denominator. */
struct Fraction {
    /// The numerator
    z3::expr numerator;
    /// The denominator
    z3::expr denominator;
};

/** Rewrites `e` as a single fraction \f$ N / D \f$ where neither \f$N\f$ nor \f$D\f$ contains a
 * division by anything other than a numeral.  Sums, differences, products, quotients and integer
 * powers are combined; anything else (symbols, numerals, fractional powers) is an atom.  No
 * cancellation of common factors is attempted.
 */
Fraction together(const z3::expr &e);

/** Extracts the coefficients of `poly`, viewed as a polynomial in `var`.  `poly` is expected in
 * sum-of-monomials form (as produced by simplify with `som` set).  On success, `coefs[i]` holds
 * the (simplified) coefficient of \f$ var^i \f$, trailing zero coefficients are removed, and true
 * is returned.  Returns false if `var` appears in `poly` other than through non-negative integer
 * powers (e.g. inside a radical or a denominator).
 */
bool coefficients(const z3::expr &poly, const z3::expr &var, std::vector<z3::expr> &coefs);

/** Simplifies `e` into sum-of-monomials form. */
z3::expr expand(const z3::expr &e);

/** Evaluates the real-valued expression `e` numerically, taking symbol values from `b`.
 * Fractional powers of negative values yield NaN, divisions by zero infinities, as the underlying
 * floating-point operations do.
 *
 * \throws unbound_symbol if `e` contains a symbol not in `b`.
 * \throws std::domain_error if `e` contains an operator that cannot be evaluated numerically.
 */
double evaluate(const z3::expr &e, const Bindings &b);

/** Replaces fractional powers by fresh, polynomially-constrained variables so that an expression
 * can be handed to Z3's nonlinear real arithmetic solver.  A term \f$ b^{p/q} \f$ (with \f$q > 1\f$)
 * becomes \f$ r^p \f$ for a fresh \f$r\f$ constrained by \f$ r^q = b \f$ (and \f$ r \geq 0 \f$ for
 * even \f$q\f$), which describes the principal root wherever the radicand is in its domain.
 * Integer powers become products.  The same radicand and root degree always map to the same
 * variable, so several calls on one Purifier share their variables.
 */
class Purifier final {
    public:
        /// Creates a purifier introducing variables in the given context.
        explicit Purifier(z3::context &ctx);

        /// Returns the purified form of `e`, recording any new constraints.
        z3::expr operator()(const z3::expr &e);

        /// The constraints on every variable introduced so far.
        const z3::expr_vector& constraints() const noexcept;

    private:
        z3::expr root(const z3::expr &radicand, long degree);

        z3::context &ctx_;
        z3::expr_vector constraints_;
        z3::expr_vector radicands_;
        std::map<std::pair<unsigned, long>, z3::expr> roots_;
};

} }
