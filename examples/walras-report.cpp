/// Computes the equilibrium of the two-firm, two-consumer economy and prints a welfare report

#include <walras/Equilibrium.hpp>
#include <walras/algebra/Z3Engine.hpp>
#include <iostream>
#include <string>

using namespace walras;

int main(int argc, char *argv[]) {

    // The endowment to evaluate the closed forms at; everything is solved symbolically in k.
    double k = 4;
    if (argc > 1) {
        try {
            k = std::stod(argv[1]);
        }
        catch (const std::exception &e) {
            std::cerr << "Invalid endowment `" << argv[1] << "': " << e.what() << "\n";
            return 2;
        }
        if (not (k > 0)) {
            std::cerr << "The endowment must be positive\n";
            return 2;
        }
    }

    algebra::Z3Engine engine;
    Equilibrium::Outcome out = Equilibrium(engine).run();

    const Model &m = out.model;
    std::cout << "Equilibrium system:\n";
    for (auto &eq : m.equations()) std::cout << "    " << eq << "\n";

    std::cout << "\n" << out.branches.size() << " solution branch(es):\n";
    for (size_t i = 0; i < out.branches.size(); i++)
        std::cout << "  [" << i << "] " << out.branches[i] << "\n";

    const SelectedSolution &sol = out.solution;
    std::cout << "\nSelected branch " << sol.index() << (sol.proven() ? "" : " (unproven fallback)") << "\n";

    Eigen::VectorXd v = sol.evaluate(m.bind(k));
    z3::expr_vector unknowns = m.unknowns();
    std::cout << "\nPrices and allocation at k = " << k << ":\n";
    for (unsigned i = 0; i < unknowns.size(); i++)
        std::cout << "    " << unknowns[i] << " = " << sol.branch().values()[i] << " = " << v[i] << "\n";

    const WelfareResult &w = out.welfare;
    WelfareResult::Figures f = w.evaluate(m.bind(k));
    std::cout << "\nMarket clearing:\n";
    std::cout << "    Y excess demand: " << w.excessDemandY() << (w.clearsY() ? " (clears)" : " (NOT CLEARING)") << "\n";
    std::cout << "    X excess demand: " << w.excessDemandX() << (w.clearsX() ? " (clears)" : " (NOT CLEARING)") << "\n";

    std::cout << "\nWelfare:\n";
    std::cout << "    I_A = " << w.incomeA() << " = " << f.income_a << "\n";
    std::cout << "    I_B = " << w.incomeB() << " = " << f.income_b << "\n";
    std::cout << "    A consumes (" << f.x_a << ", " << f.y_a << "), U_A = " << w.utilityA() << " = " << f.utility_a << "\n";
    std::cout << "    B consumes (" << f.x_b << ", " << f.y_b << "), U_B = " << w.utilityB() << " = " << f.utility_b << "\n";
    std::cout << "    U_A / U_B = " << w.ratio() << " = " << f.ratio << "\n";

    if (not out.warnings.empty()) {
        std::cout << "\nWarnings:\n";
        for (auto &warning : out.warnings) std::cout << "    " << warning << "\n";
    }
}
