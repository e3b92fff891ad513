#include <walras/Consumer.hpp>

namespace walras {

Consumer::Consumer(const std::string &name, const z3::expr &income) : name_(name), income_(income) {}

const z3::expr& Consumer::income() const noexcept { return income_; }
const std::string& Consumer::name() const noexcept { return name_; }

z3::expr Consumer::demandX(const z3::expr &px) const {
    return demandX(px, income_);
}

z3::expr Consumer::demandY(const z3::expr &py) const {
    return demandY(py, income_);
}

z3::expr Consumer::indirectUtility(const z3::expr &px, const z3::expr &py) const {
    return utility(demandX(px), demandY(py));
}

}
