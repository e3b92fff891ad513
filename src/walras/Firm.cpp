#include <walras/Firm.hpp>

namespace walras {

Firm::Firm(const std::string &name) : name_(name) {}

const std::string& Firm::name() const noexcept {
    return name_;
}

z3::expr Firm::profit(const z3::expr &p, const z3::expr &z, const z3::expr &pz) const {
    return p * output(z) - pz * z;
}

z3::expr Firm::optimality(const z3::expr &p, const z3::expr &z, const z3::expr &pz) const {
    return p * marginalProduct(z) - pz;
}

}
