#include <walras/consumer/CobbDouglas.hpp>
#include <walras/algebra/expression.hpp>
#include <stdexcept>

namespace walras { namespace consumer {

CobbDouglas::CobbDouglas(const std::string &name, const z3::expr &income, int exp_x, int exp_y)
    : Consumer(name, income), exp_x_(exp_x), exp_y_(exp_y) {
    if (exp_x <= 0 or exp_y <= 0)
        throw std::invalid_argument("consumer::CobbDouglas: exponents must be positive");
}

int CobbDouglas::expX() const noexcept { return exp_x_; }
int CobbDouglas::expY() const noexcept { return exp_y_; }

z3::expr CobbDouglas::demandX(const z3::expr &px, const z3::expr &income) const {
    return px.ctx().real_val(exp_x_, exp_x_ + exp_y_) * income / px;
}

z3::expr CobbDouglas::demandY(const z3::expr &py, const z3::expr &income) const {
    return py.ctx().real_val(exp_y_, exp_x_ + exp_y_) * income / py;
}

z3::expr CobbDouglas::utility(const z3::expr &x, const z3::expr &y) const {
    return algebra::integer_power(x, exp_x_) * algebra::integer_power(y, exp_y_);
}

} }
