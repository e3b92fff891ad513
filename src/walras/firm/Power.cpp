#include <walras/firm/Power.hpp>
#include <walras/algebra/expression.hpp>
#include <stdexcept>

namespace walras { namespace firm {

namespace {
boost::rational<int> checked_exponent(int numerator, int denominator) {
    if (denominator == 0)
        throw std::invalid_argument("firm::Power: exponent denominator cannot be 0");
    boost::rational<int> e(numerator, denominator);
    if (e <= 0 or e > 1)
        throw std::invalid_argument("firm::Power: exponent must be in (0, 1]");
    return e;
}
}

Power::Power(const std::string &name, int numerator, int denominator)
    : Firm(name), exponent_(checked_exponent(numerator, denominator)) {}

const boost::rational<int>& Power::exponent() const noexcept {
    return exponent_;
}

z3::expr Power::output(const z3::expr &z) const {
    return algebra::rational_power(z, exponent_);
}

z3::expr Power::marginalProduct(const z3::expr &z) const {
    auto &ctx = z.ctx();
    z3::expr coef = ctx.real_val(exponent_.numerator(), exponent_.denominator());
    if (exponent_ == 1) return coef;
    return coef * algebra::rational_power(z, exponent_ - 1);
}

} }
