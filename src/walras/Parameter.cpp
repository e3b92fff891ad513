#include <walras/Parameter.hpp>
#include <stdexcept>

namespace walras {

Parameter::Parameter(z3::context &ctx, const std::string &name, Domain domain, Role role)
    : Parameter(name, domain, role, ctx.real_const(name.c_str())) {
    if (role == Role::numeraire)
        throw std::invalid_argument("Parameter: the numeraire must be created with Parameter::numeraire()");
}

Parameter::Parameter(const std::string &name, Domain domain, Role role, const z3::expr &symbol)
    : name_(name), domain_(domain), role_(role), symbol_(symbol) {}

Parameter Parameter::numeraire(z3::context &ctx, const std::string &name) {
    return Parameter(name, Domain::positive, Role::numeraire, ctx.real_val(1));
}

const std::string& Parameter::name() const noexcept { return name_; }
Domain Parameter::domain() const noexcept { return domain_; }
Role Parameter::role() const noexcept { return role_; }
const z3::expr& Parameter::symbol() const noexcept { return symbol_; }

z3::expr Parameter::assumption() const {
    if (domain_ == Domain::positive and role_ != Role::numeraire)
        return symbol_ > 0;
    return symbol_.ctx().bool_val(true);
}

}
