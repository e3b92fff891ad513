#include <walras/Equilibrium.hpp>
#include <walras/Solver.hpp>
#include <walras/debug.hpp>

namespace walras {

constexpr unsigned Equilibrium::Options::default_timeout_ms;

Equilibrium::Equilibrium(const algebra::Engine &engine) : Equilibrium(engine, Options()) {}

Equilibrium::Equilibrium(const algebra::Engine &engine, const Options &options)
    : engine_(engine), options_(options) {}

const Equilibrium::Options& Equilibrium::options() const noexcept { return options_; }

Equilibrium::Outcome Equilibrium::run() const {
    WALRAS_TDBG("building model");
    Model model = Model::build();

    WALRAS_TDBG("solving");
    std::vector<algebra::Branch> branches = Solver(engine_, options_.timeout_ms).solve(model);

    WALRAS_TDBG("selecting among " << branches.size() << " branch(es)");
    SelectedSolution solution = Selector(engine_, options_.sanity_check, options_.sample_endowments)
        .select(model, branches);

    WALRAS_TDBG("verifying branch " << solution.index());
    WelfareResult welfare = Verifier(engine_).verify(model, solution);

    std::vector<Warning> warnings = solution.warnings();
    warnings.insert(warnings.end(), welfare.warnings().begin(), welfare.warnings().end());

    return Outcome{model, branches, solution, welfare, warnings};
}

}
