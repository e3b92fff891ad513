#pragma once
#include <z3++.h>
#include <ostream>
#include <string>

namespace walras {

/** A symbolic equality `lhs == rhs` between two real-valued expressions, with a short label
 * describing where it comes from (e.g. "alpha optimality").
 */
struct Equation {
    /// Constructs an equation from its two sides and a label.
    Equation(const z3::expr &lhs, const z3::expr &rhs, const std::string &label)
        : lhs(lhs), rhs(rhs), label(label) {}

    /// The left-hand side
    z3::expr lhs;
    /// The right-hand side
    z3::expr rhs;
    /// A short description of the equation
    std::string label;

    /// Returns `lhs - rhs`, which is zero exactly when the equation holds.
    z3::expr difference() const { return lhs - rhs; }

    /// Returns the equation as a Z3 boolean `lhs == rhs`.
    z3::expr holds() const { return lhs == rhs; }
};

/** Prints an equation as `label: lhs = rhs`. */
inline std::ostream& operator<<(std::ostream &os, const Equation &eq) {
    return os << eq.label << ": " << eq.lhs << " = " << eq.rhs;
}

}
