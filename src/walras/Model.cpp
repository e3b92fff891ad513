#include <walras/Model.hpp>
#include <walras/firm/Linear.hpp>
#include <walras/firm/Power.hpp>
#include <walras/consumer/CobbDouglas.hpp>
#include <walras/debug.hpp>

namespace walras {

Model Model::build() {
    return Model(std::make_shared<z3::context>());
}

Model::Model(const std::shared_ptr<z3::context> &ctx)
    : ctx_(ctx),
    px_(*ctx, "px", Domain::positive, Role::unknown),
    py_(*ctx, "py", Domain::positive, Role::unknown),
    pz_(Parameter::numeraire(*ctx, "pz")),
    k_(*ctx, "k", Domain::positive, Role::exogenous),
    z_alpha_(*ctx, "z_alpha", Domain::positive, Role::unknown),
    z_beta_(*ctx, "z_beta", Domain::positive, Role::unknown)
{
    alpha_ = std::make_shared<firm::Linear>("alpha", 2);
    beta_ = std::make_shared<firm::Power>("beta", 1, 2);

    consumer_a_ = std::make_shared<consumer::CobbDouglas>("A", k_.symbol() * pz_.symbol());
    // B's income is beta's profit function, kept symbolic: it is only evaluated once a solution for
    // py and z_beta has been substituted into it.
    consumer_b_ = std::make_shared<consumer::CobbDouglas>("B", beta_->profit(py_, z_beta_, pz_));

    equations_.emplace_back(alpha_->optimality(px_, z_alpha_, pz_), ctx->real_val(0), "alpha optimality");
    equations_.emplace_back(beta_->optimality(py_, z_beta_, pz_), ctx->real_val(0), "beta optimality");
    equations_.emplace_back(k_.symbol(), z_alpha_.symbol() + z_beta_.symbol(), "input market clearing");
    equations_.emplace_back(supplyY(), demandY(), "Y market clearing");

    for (auto &eq : equations_) WALRAS_DBG(eq);
}

z3::context& Model::context() const noexcept { return *ctx_; }

const Parameter& Model::px() const noexcept { return px_; }
const Parameter& Model::py() const noexcept { return py_; }
const Parameter& Model::pz() const noexcept { return pz_; }
const Parameter& Model::k() const noexcept { return k_; }
const Parameter& Model::zAlpha() const noexcept { return z_alpha_; }
const Parameter& Model::zBeta() const noexcept { return z_beta_; }

std::vector<Parameter> Model::parameters() const {
    return { px_, py_, pz_, k_, z_alpha_, z_beta_ };
}

const Firm& Model::alpha() const noexcept { return *alpha_; }
const Firm& Model::beta() const noexcept { return *beta_; }
const Consumer& Model::consumerA() const noexcept { return *consumer_a_; }
const Consumer& Model::consumerB() const noexcept { return *consumer_b_; }

const std::vector<Equation>& Model::equations() const noexcept { return equations_; }

z3::expr_vector Model::unknowns() const {
    z3::expr_vector u(*ctx_);
    for (auto &p : parameters()) {
        if (p.role() == Role::unknown) u.push_back(p.symbol());
    }
    return u;
}

z3::expr_vector Model::assumptions() const {
    z3::expr_vector a(*ctx_);
    for (auto &p : parameters()) {
        if (p.role() == Role::exogenous and p.domain() == Domain::positive)
            a.push_back(p.assumption());
    }
    return a;
}

Bindings Model::bind(double k) const {
    return Bindings{{k_.name(), k}};
}

z3::expr Model::supplyX() const { return alpha_->output(z_alpha_); }
z3::expr Model::supplyY() const { return beta_->output(z_beta_); }

z3::expr Model::demandX() const {
    return consumer_a_->demandX(px_) + consumer_b_->demandX(px_);
}

z3::expr Model::demandY() const {
    return consumer_a_->demandY(py_) + consumer_b_->demandY(py_);
}

z3::expr Model::excessDemandX() const { return demandX() - supplyX(); }
z3::expr Model::excessDemandY() const { return demandY() - supplyY(); }

}
