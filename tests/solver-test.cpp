#include <walras/Solver.hpp>
#include <gtest/gtest.h>
#include "stub-engine.hpp"

using namespace walras;
using walras::algebra::Branch;
using walras::algebra::Engine;

TEST(Solver, AllBranches) {
    Model m = Model::build();
    StubEngine engine;
    auto branches = Solver(engine).solve(m);
    EXPECT_EQ(2, branches.size());
    EXPECT_EQ(1, engine.solve_calls);
    for (auto &b : branches) EXPECT_EQ(4, b.size());
}

TEST(Solver, Options) {
    Model m = Model::build();
    StubEngine engine;
    Solver s(engine, 60000);
    EXPECT_EQ(60000, s.timeoutMs());
    s.solve(m);
    EXPECT_TRUE(engine.last_options.conditions);
    EXPECT_EQ(60000, engine.last_options.timeout_ms);
}

TEST(Solver, NoSolution) {
    Model m = Model::build();
    StubEngine engine([](const z3::expr_vector&) { return std::vector<Branch>(); });
    EXPECT_THROW(Solver(engine).solve(m), Solver::no_solution);
}

TEST(Solver, EngineFailuresPropagate) {
    Model m = Model::build();
    StubEngine slow([](const z3::expr_vector&) -> std::vector<Branch> { throw Engine::timeout(10); });
    EXPECT_THROW(Solver(slow, 10).solve(m), Engine::timeout);

    StubEngine broken([](const z3::expr_vector&) -> std::vector<Branch> { throw Engine::unsupported("degree 5"); });
    EXPECT_THROW(Solver(broken).solve(m), Engine::unsupported);
}

TEST(Solver, Mismatch) {
    Solver::mismatch e(3, 4);
    EXPECT_EQ(std::string("Equilibrium system has 3 equations but 4 unknowns"), e.what());
}
