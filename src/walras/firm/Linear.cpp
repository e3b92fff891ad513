#include <walras/firm/Linear.hpp>
#include <stdexcept>

namespace walras { namespace firm {

Linear::Linear(const std::string &name, int productivity) : Firm(name), productivity_(productivity) {
    if (productivity <= 0)
        throw std::invalid_argument("firm::Linear: productivity must be positive");
}

int Linear::productivity() const noexcept {
    return productivity_;
}

z3::expr Linear::output(const z3::expr &z) const {
    return z.ctx().real_val(productivity_) * z;
}

z3::expr Linear::marginalProduct(const z3::expr &z) const {
    return z.ctx().real_val(productivity_);
}

z3::expr Linear::optimality(const z3::expr &p, const z3::expr&, const z3::expr &pz) const {
    return p.ctx().real_val(productivity_) * p - pz;
}

} }
