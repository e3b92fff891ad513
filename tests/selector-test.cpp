// Branch selection: admissibility proofs, preference among admissible branches, and the fallback

#include <walras/Selector.hpp>
#include <walras/Solver.hpp>
#include <gtest/gtest.h>
#include "stub-engine.hpp"

using namespace walras;
using walras::algebra::Branch;

class SelectorTest : public ::testing::Test {
    protected:
        // A branch of the model with the given values for px, py, z_alpha, z_beta
        Branch branch(const z3::expr &px, const z3::expr &py, const z3::expr &za, const z3::expr &zb,
                const std::vector<z3::expr> &conds = {}) {
            z3::expr_vector values(m.context()), conditions(m.context());
            values.push_back(px);
            values.push_back(py);
            values.push_back(za);
            values.push_back(zb);
            for (auto &c : conds) conditions.push_back(c);
            return Branch(m.unknowns(), values, conditions);
        }

        Model m = Model::build();
        z3::expr k = m.k().symbol();
        z3::expr half = m.context().real_val(1, 2);
        z3::expr root = z3::pw(k / 3, half);
        // The true equilibrium and its negative-root twin
        Branch good = branch(half, 2 * root, 2 * k / 3, k / 3);
        Branch negative = branch(half, -2 * root, 2 * k / 3, k / 3);
};

TEST_F(SelectorTest, PicksProvablyPositive) {
    StubEngine engine;
    Selector s(engine);
    SelectedSolution sol = s.select(m, {negative, good});
    EXPECT_EQ(1, sol.index());
    EXPECT_TRUE(sol.proven());
    EXPECT_TRUE(sol.warnings().empty());
    EXPECT_TRUE(z3::eq(good[m.py()], sol[m.py()]));
    EXPECT_NEAR(2, sol.evaluate(m.bind(3))[1], 1e-12);
}

TEST_F(SelectorTest, PrefersFullyPositive) {
    StubEngine engine;
    // py > 0 but z_alpha < 0
    Branch lopsided = branch(half, 2 * root, -k, k / 3);
    SelectedSolution sol = Selector(engine).select(m, {negative, lopsided, good});
    EXPECT_EQ(2, sol.index());

    // Without a fully positive branch, the first with positive py wins
    sol = Selector(engine).select(m, {negative, lopsided});
    EXPECT_EQ(1, sol.index());
    EXPECT_TRUE(sol.proven());
}

TEST_F(SelectorTest, SkipsInfeasible) {
    StubEngine engine;
    // Positive values, but only valid where a square root of 12k is negative and nonzero
    z3::expr r = z3::pw(12 * k, half);
    Branch impossible = branch(half, 2 * root, 2 * k / 3, k / 3, {r <= 0, r != 0});
    SelectedSolution sol = Selector(engine).select(m, {impossible, good});
    EXPECT_EQ(1, sol.index());
    EXPECT_TRUE(sol.proven());

    // Satisfiable conditions don't get in the way
    Branch conditional = branch(half, 2 * root, 2 * k / 3, k / 3, {r >= 0});
    EXPECT_EQ(0, Selector(engine).select(m, {conditional, good}).index());

    // Undecided conditions neither: with nothing provable, the first branch is the fallback
    StubEngine undecided(nullptr, false);
    sol = Selector(undecided, false, {1}).select(m, {impossible, good});
    EXPECT_EQ(0, sol.index());
    EXPECT_FALSE(sol.proven());
}

TEST_F(SelectorTest, Fallback) {
    StubEngine engine(nullptr, false);
    SelectedSolution sol = Selector(engine).select(m, {good, negative});
    EXPECT_EQ(0, sol.index());
    EXPECT_FALSE(sol.proven());
    ASSERT_EQ(1, sol.warnings().size());
    EXPECT_EQ(Warning::Kind::ambiguous_positivity, sol.warnings()[0].kind());
    EXPECT_GT(engine.queries, 0);
}

TEST_F(SelectorTest, FallbackSanityCheck) {
    StubEngine engine(nullptr, false);
    EXPECT_THROW(Selector(engine).select(m, {negative, good}), Selector::inadmissible);

    // Disabled, the first branch is returned regardless
    SelectedSolution sol = Selector(engine, false, {1, 4, 16}).select(m, {negative, good});
    EXPECT_EQ(0, sol.index());
    EXPECT_FALSE(sol.proven());

    // Only the sample endowments are checked
    Branch shrinking = branch(half, 2 * root, 2 - k, k / 3);
    EXPECT_NO_THROW(Selector(engine, true, {1}).select(m, {shrinking}));
    EXPECT_THROW(Selector(engine, true, {1, 4}).select(m, {shrinking}), Selector::inadmissible);
}

TEST_F(SelectorTest, NoBranches) {
    StubEngine engine;
    EXPECT_THROW(Selector(engine).select(m, {}), Solver::no_solution);
}

TEST_F(SelectorTest, Defaults) {
    EXPECT_TRUE(Selector::default_sanity_check);
    EXPECT_EQ(16, Selector::default_sample_endowments[2]);
}
