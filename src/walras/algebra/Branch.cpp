#include <walras/algebra/Branch.hpp>
#include <walras/algebra/expression.hpp>
#include <stdexcept>

namespace walras { namespace algebra {

Branch::Branch(const z3::expr_vector &unknowns, const z3::expr_vector &values, const z3::expr_vector &conditions)
    : unknowns_(unknowns), values_(values), conditions_(conditions) {
    if (unknowns.size() != values.size())
        throw std::invalid_argument("Branch: unknowns and values must have the same size");
}

const z3::expr_vector& Branch::unknowns() const noexcept { return unknowns_; }
const z3::expr_vector& Branch::values() const noexcept { return values_; }
const z3::expr_vector& Branch::conditions() const noexcept { return conditions_; }

unsigned Branch::size() const {
    return unknowns_.size();
}

z3::expr Branch::operator[](const z3::expr &unknown) const {
    for (unsigned i = 0; i < unknowns_.size(); i++) {
        if (z3::eq(unknowns_[i], unknown)) return values_[i];
    }
    throw std::out_of_range("Branch: `" + unknown.to_string() + "' is not assigned by this branch");
}

z3::expr Branch::substitute(const z3::expr &e) const {
    // expr::substitute() is not a const member
    z3::expr copy(e);
    return copy.substitute(unknowns_, values_);
}

Eigen::VectorXd Branch::evaluate(const Bindings &b) const {
    Eigen::VectorXd v(unknowns_.size());
    for (unsigned i = 0; i < values_.size(); i++) {
        v[i] = algebra::evaluate(values_[i], b);
    }
    return v;
}

std::ostream& operator<<(std::ostream &os, const Branch &b) {
    os << "{";
    for (unsigned i = 0; i < b.size(); i++) {
        if (i > 0) os << ", ";
        os << b.unknowns()[i] << " = " << b.values()[i];
    }
    os << "}";
    if (b.conditions().size() > 0) {
        os << " if {";
        for (unsigned i = 0; i < b.conditions().size(); i++) {
            if (i > 0) os << ", ";
            os << b.conditions()[i];
        }
        os << "}";
    }
    return os;
}

} }
