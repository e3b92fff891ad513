// End-to-end runs of the equilibrium pipeline

#include <walras/Equilibrium.hpp>
#include <walras/algebra/Z3Engine.hpp>
#include <walras/algebra/expression.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include "stub-engine.hpp"

using namespace walras;
using walras::algebra::Branch;

// True if e is built from k and numerals by products, negation and powers alone
bool monomial(const z3::expr &e, const z3::expr &k) {
    if (e.is_numeral() or z3::eq(e, k)) return true;
    if (not e.is_app()) return false;
    switch (e.decl().decl_kind()) {
        case Z3_OP_MUL:
        case Z3_OP_UMINUS:
        case Z3_OP_POWER:
            break;
        default:
            return false;
    }
    for (unsigned i = 0; i < e.num_args(); i++) {
        if (not monomial(e.arg(i), k)) return false;
    }
    return true;
}

class EquilibriumTest : public ::testing::Test {
    protected:
        static void SetUpTestCase() {
            engine = new algebra::Z3Engine();
            outcome = new Equilibrium::Outcome(Equilibrium(*engine).run());
        }

        static void TearDownTestCase() {
            delete outcome;
            outcome = nullptr;
            delete engine;
            engine = nullptr;
        }

        // One shared run: the pipeline is deterministic and reasonably slow
        static algebra::Z3Engine *engine;
        static Equilibrium::Outcome *outcome;
};

algebra::Z3Engine *EquilibriumTest::engine = nullptr;
Equilibrium::Outcome *EquilibriumTest::outcome = nullptr;

TEST_F(EquilibriumTest, Scenario) {
    const Equilibrium::Outcome &out = *outcome;
    EXPECT_EQ(2, out.branches.size());
    EXPECT_EQ(1, out.solution.index());
    EXPECT_TRUE(out.solution.proven());
    EXPECT_TRUE(out.warnings.empty());

    Eigen::VectorXd v = out.solution.evaluate(out.model.bind(4));
    EXPECT_NEAR(0.5, v[0], 1e-12);
    EXPECT_NEAR(2 * std::sqrt(4.0 / 3), v[1], 1e-12);
    EXPECT_NEAR(8.0 / 3, v[2], 1e-12);
    EXPECT_NEAR(4.0 / 3, v[3], 1e-12);

    WelfareResult::Figures f = out.welfare.evaluate(out.model.bind(4));
    EXPECT_NEAR(4, f.income_a, 1e-12);
    EXPECT_NEAR(4.0 / 3, f.income_b, 1e-12);
    EXPECT_NEAR(9, f.ratio, 1e-12);
}

TEST_F(EquilibriumTest, ClosureLaw) {
    for (auto t : Verifier(*engine).closure(outcome->model, outcome->solution.branch()))
        EXPECT_EQ(Truth::yes, t);
    for (double k : {0.25, 1.0, 7.0, 1000.0})
        EXPECT_LT(Verifier(*engine).residuals(outcome->model, outcome->solution.branch(), k).cwiseAbs().maxCoeff(), 1e-9);
}

TEST_F(EquilibriumTest, Admissibility) {
    const Model &m = outcome->model;
    const SelectedSolution &sol = outcome->solution;
    for (const Parameter &p : {m.px(), m.py(), m.zAlpha(), m.zBeta()})
        EXPECT_EQ(Truth::yes, engine->isAlwaysTrue(sol[p] > 0, m.assumptions())) << p.name();
    EXPECT_EQ(Truth::yes, engine->isAlwaysTrue(sol[m.zAlpha()] + sol[m.zBeta()] == m.k().symbol(), m.assumptions()));
}

TEST_F(EquilibriumTest, ClosedForms) {
    const Model &m = outcome->model;
    const SelectedSolution &sol = outcome->solution;
    z3::expr k = m.k().symbol();

    // z_beta = k/3, literally
    z3::expr zb = sol[m.zBeta()];
    EXPECT_EQ(Truth::yes, engine->isAlwaysTrue(zb == k / 3, m.assumptions()));
    ASSERT_EQ(Z3_OP_MUL, zb.decl().decl_kind());
    ASSERT_EQ(2, zb.num_args());
    boost::rational<long long> c;
    ASSERT_TRUE(algebra::numeral_value(zb.arg(0), c));
    EXPECT_EQ(boost::rational<long long>(1, 3), c);
    EXPECT_TRUE(z3::eq(k, zb.arg(1)));

    for (const Parameter &p : {m.px(), m.py(), m.zAlpha()})
        EXPECT_TRUE(monomial(sol[p], k)) << p.name() << " = " << sol[p];

    const WelfareResult &w = outcome->welfare;
    EXPECT_EQ(Truth::yes, engine->isAlwaysTrue(w.incomeB() == k / 3, m.assumptions()));
    for (const z3::expr &e : {w.incomeA(), w.incomeB(), w.utilityA(), w.utilityB()})
        EXPECT_TRUE(monomial(e, k)) << e;
}

TEST_F(EquilibriumTest, InfeasibleTwin) {
    // The negative-price branch is only valid where a square root of a positive number is negative
    const Model &m = outcome->model;
    const Branch &twin = outcome->branches[0];
    ASSERT_GT(twin.conditions().size(), 0);
    EXPECT_EQ(Truth::yes, engine->isAlwaysTrue(not z3::mk_and(twin.conditions()), m.assumptions()));
    EXPECT_LT(twin.evaluate(m.bind(4))[1], 0);
}

TEST_F(EquilibriumTest, WalrasLaw) {
    EXPECT_TRUE(outcome->welfare.clearsY());
    EXPECT_TRUE(outcome->welfare.clearsX());
    for (double k : {1.0, 4.0, 50.0}) {
        WelfareResult::Figures f = outcome->welfare.evaluate(outcome->model.bind(k));
        EXPECT_NEAR(0, f.excess_demand_x, 1e-9);
        EXPECT_NEAR(0, f.excess_demand_y, 1e-9);
    }
}

TEST_F(EquilibriumTest, Scaling) {
    const SelectedSolution &sol = outcome->solution;
    const Model &m = outcome->model;
    const double k = 1.5;
    Eigen::VectorXd base = sol.evaluate(m.bind(k));
    WelfareResult::Figures fbase = outcome->welfare.evaluate(m.bind(k));
    for (double c : {2.0, 9.0}) {
        Eigen::VectorXd scaled = sol.evaluate(m.bind(c * k));
        // px is pinned by firm Alpha; quantities scale with the endowment; py with its square root
        EXPECT_NEAR(base[0], scaled[0], 1e-12);
        EXPECT_NEAR(std::sqrt(c) * base[1], scaled[1], 1e-9);
        EXPECT_NEAR(c * base[2], scaled[2], 1e-9);
        EXPECT_NEAR(c * base[3], scaled[3], 1e-9);

        WelfareResult::Figures f = outcome->welfare.evaluate(m.bind(c * k));
        EXPECT_NEAR(c * fbase.income_a, f.income_a, 1e-9);
        EXPECT_NEAR(c * fbase.income_b, f.income_b, 1e-9);
        EXPECT_NEAR(fbase.ratio, f.ratio, 1e-9);
    }
}

TEST_F(EquilibriumTest, Deterministic) {
    Equilibrium::Outcome again = Equilibrium(*engine).run();
    ASSERT_EQ(outcome->branches.size(), again.branches.size());
    for (size_t i = 0; i < again.branches.size(); i++) {
        for (unsigned j = 0; j < again.branches[i].size(); j++)
            EXPECT_EQ(outcome->branches[i].values()[j].to_string(), again.branches[i].values()[j].to_string());
    }
    EXPECT_EQ(outcome->solution.index(), again.solution.index());
    EXPECT_EQ(outcome->welfare.ratio().to_string(), again.welfare.ratio().to_string());
}

TEST(Equilibrium, Options) {
    Equilibrium::Options o;
    EXPECT_EQ(0, o.timeout_ms);
    EXPECT_TRUE(o.sanity_check);
    ASSERT_EQ(3, o.sample_endowments.size());
    EXPECT_EQ(1, o.sample_endowments[0]);
    EXPECT_EQ(16, o.sample_endowments[2]);
}

TEST(Equilibrium, FallbackRejected) {
    // Undecided positivity falls back to the first branch, which has a negative py
    StubEngine undecided(nullptr, false);
    EXPECT_THROW(Equilibrium(undecided).run(), Selector::inadmissible);
}

TEST(Equilibrium, FallbackUnchecked) {
    StubEngine undecided(nullptr, false);
    Equilibrium::Options o;
    o.sanity_check = false;
    Equilibrium::Outcome out = Equilibrium(undecided, o).run();
    EXPECT_EQ(0, out.solution.index());
    EXPECT_FALSE(out.solution.proven());
    ASSERT_FALSE(out.warnings.empty());
    EXPECT_EQ(Warning::Kind::ambiguous_positivity, out.warnings.front().kind());
}

TEST(Equilibrium, FallbackAccepted) {
    // Canned branches, positive one first, with nothing provable
    StubEngine undecided([](const z3::expr_vector &unknowns) {
        z3::context &ctx = unknowns.ctx();
        z3::expr k = ctx.real_const("k"), half = ctx.real_val(1, 2);
        z3::expr root = z3::pw(k / 3, half);
        std::vector<Branch> branches;
        for (int sign : {1, -1}) {
            z3::expr_vector values(ctx), conditions(ctx);
            values.push_back(half);
            values.push_back(sign * 2 * root);
            values.push_back(2 * k / 3);
            values.push_back(k / 3);
            branches.emplace_back(unknowns, values, conditions);
        }
        return branches;
    }, false);

    Equilibrium::Outcome out = Equilibrium(undecided).run();
    EXPECT_EQ(1, undecided.solve_calls);
    EXPECT_EQ(0, out.solution.index());
    EXPECT_FALSE(out.solution.proven());
    ASSERT_FALSE(out.warnings.empty());
    EXPECT_EQ(Warning::Kind::ambiguous_positivity, out.warnings.front().kind());
    EXPECT_NEAR(9, out.welfare.evaluate(out.model.bind(2)).ratio, 1e-12);
}
