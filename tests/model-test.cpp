#include <walras/Model.hpp>
#include <walras/Parameter.hpp>
#include <walras/firm/Linear.hpp>
#include <walras/firm/Power.hpp>
#include <walras/consumer/CobbDouglas.hpp>
#include <walras/algebra/expression.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <string>

using namespace walras;
using walras::algebra::evaluate;
using walras::algebra::free_symbols;

// The closed-form equilibrium at k = 3: px = 1/2, py = 2, z_alpha = 2, z_beta = 1
Bindings equilibrium_at_3() {
    return Bindings{{"k", 3}, {"px", 0.5}, {"py", 2}, {"z_alpha", 2}, {"z_beta", 1}};
}

TEST(Model, Shape) {
    Model m = Model::build();
    ASSERT_EQ(4, m.equations().size());

    auto u = m.unknowns();
    ASSERT_EQ(4, u.size());
    EXPECT_EQ("px", u[0].to_string());
    EXPECT_EQ("py", u[1].to_string());
    EXPECT_EQ("z_alpha", u[2].to_string());
    EXPECT_EQ("z_beta", u[3].to_string());

    EXPECT_EQ("alpha optimality", m.equations()[0].label);
    EXPECT_EQ("beta optimality", m.equations()[1].label);
    EXPECT_EQ("input market clearing", m.equations()[2].label);
    EXPECT_EQ("Y market clearing", m.equations()[3].label);

    EXPECT_EQ(1, m.assumptions().size());
    EXPECT_EQ(6, m.parameters().size());
}

TEST(Model, Deterministic) {
    Model a = Model::build(), b = Model::build();
    ASSERT_EQ(a.equations().size(), b.equations().size());
    for (size_t i = 0; i < a.equations().size(); i++) {
        EXPECT_EQ(a.equations()[i].lhs.to_string(), b.equations()[i].lhs.to_string());
        EXPECT_EQ(a.equations()[i].rhs.to_string(), b.equations()[i].rhs.to_string());
    }
    EXPECT_EQ(a.demandX().to_string(), b.demandX().to_string());
    EXPECT_EQ(a.consumerB().income().to_string(), b.consumerB().income().to_string());
}

TEST(Model, NumeraireIsNotASymbol) {
    Model m = Model::build();
    EXPECT_EQ(Role::numeraire, m.pz().role());
    EXPECT_TRUE(m.pz().symbol().is_numeral());

    bool k_seen = false;
    for (auto &eq : m.equations()) {
        for (auto &s : free_symbols(eq.difference())) {
            std::string name = s.to_string();
            EXPECT_NE("pz", name);
            EXPECT_TRUE(name == "px" or name == "py" or name == "z_alpha" or name == "z_beta" or name == "k") << name;
            if (name == "k") k_seen = true;
        }
    }
    EXPECT_TRUE(k_seen);
}

TEST(Model, EquationsHoldAtClosedForm) {
    Model m = Model::build();
    Bindings b = equilibrium_at_3();
    for (auto &eq : m.equations())
        EXPECT_NEAR(0, evaluate(eq.difference(), b), 1e-12) << eq;

    // Away from the equilibrium the Y market doesn't clear
    b["py"] = 3;
    EXPECT_GT(std::fabs(evaluate(m.equations()[3].difference(), b)), 1e-3);
}

TEST(Model, Identities) {
    Model m = Model::build();
    Bindings b = equilibrium_at_3();

    EXPECT_DOUBLE_EQ(4, evaluate(m.supplyX(), b));
    EXPECT_DOUBLE_EQ(1, evaluate(m.supplyY(), b));
    EXPECT_DOUBLE_EQ(4, evaluate(m.demandX(), b));
    EXPECT_DOUBLE_EQ(1, evaluate(m.demandY(), b));
    EXPECT_NEAR(0, evaluate(m.excessDemandX(), b), 1e-12);
    EXPECT_NEAR(0, evaluate(m.excessDemandY(), b), 1e-12);

    EXPECT_DOUBLE_EQ(3, evaluate(m.consumerA().income(), b));
    EXPECT_DOUBLE_EQ(1, evaluate(m.consumerB().income(), b));
    EXPECT_DOUBLE_EQ(3, evaluate(m.beta().profit(m.py(), m.zBeta(), m.pz()) * 3, b));
}

TEST(Model, Bind) {
    Model m = Model::build();
    Bindings b = m.bind(2.5);
    ASSERT_EQ(1, b.size());
    EXPECT_EQ(2.5, b.at("k"));
}

TEST(Parameter, Assumptions) {
    z3::context ctx;
    Parameter k(ctx, "k", Domain::positive, Role::exogenous);
    Parameter r(ctx, "r", Domain::real, Role::unknown);
    Parameter pz = Parameter::numeraire(ctx, "pz");

    EXPECT_EQ("k", k.name());
    EXPECT_EQ(Z3_OP_GT, k.assumption().decl().decl_kind());
    EXPECT_TRUE(r.assumption().is_true());
    EXPECT_TRUE(pz.assumption().is_true());
    EXPECT_THROW(Parameter(ctx, "p", Domain::positive, Role::numeraire), std::invalid_argument);
}

TEST(Firm, Linear) {
    z3::context ctx;
    z3::expr p = ctx.real_const("p"), z = ctx.real_const("z"), pz = ctx.real_val(1);
    firm::Linear f("f", 2);
    Bindings b{{"p", 0.75}, {"z", 3}};

    EXPECT_DOUBLE_EQ(6, evaluate(f.output(z), b));
    EXPECT_DOUBLE_EQ(0.5, evaluate(f.optimality(p, z, pz), b));
    EXPECT_DOUBLE_EQ(1.5, evaluate(f.profit(p, z, pz), b));
    EXPECT_THROW(firm::Linear("g", 0), std::invalid_argument);
}

TEST(Firm, Power) {
    z3::context ctx;
    z3::expr p = ctx.real_const("p"), z = ctx.real_const("z"), pz = ctx.real_val(1);
    firm::Power f("f");
    EXPECT_EQ(boost::rational<int>(1, 2), f.exponent());

    Bindings b{{"p", 4}, {"z", 4}};
    EXPECT_DOUBLE_EQ(2, evaluate(f.output(z), b));
    EXPECT_DOUBLE_EQ(0.25, evaluate(f.marginalProduct(z), b));
    // profit = 4*2 - 4; first-order condition 4 * 1/4 - 1
    EXPECT_DOUBLE_EQ(4, evaluate(f.profit(p, z, pz), b));
    EXPECT_DOUBLE_EQ(0, evaluate(f.optimality(p, z, pz), b));

    EXPECT_THROW(firm::Power("g", 0, 1), std::invalid_argument);
    EXPECT_THROW(firm::Power("g", 3, 2), std::invalid_argument);
    EXPECT_THROW(firm::Power("g", 1, 0), std::invalid_argument);
    EXPECT_NO_THROW(firm::Power("g", 2, 2));
}

TEST(Consumer, CobbDouglas) {
    z3::context ctx;
    z3::expr px = ctx.real_const("px"), py = ctx.real_const("py"), I = ctx.real_const("I");
    consumer::CobbDouglas c("c", I);
    consumer::CobbDouglas d("d", I, 1, 3);
    Bindings b{{"px", 2}, {"py", 0.5}, {"I", 8}};

    EXPECT_DOUBLE_EQ(2, evaluate(c.demandX(px), b));
    EXPECT_DOUBLE_EQ(8, evaluate(c.demandY(py), b));
    EXPECT_DOUBLE_EQ(16, evaluate(c.indirectUtility(px, py), b));

    EXPECT_DOUBLE_EQ(1, evaluate(d.demandX(px), b));
    EXPECT_DOUBLE_EQ(12, evaluate(d.demandY(py), b));
    EXPECT_DOUBLE_EQ(1728, evaluate(d.indirectUtility(px, py), b));

    EXPECT_THROW(consumer::CobbDouglas("e", I, 0, 1), std::invalid_argument);
}
