#include <walras/Selector.hpp>
#include <walras/Solver.hpp>
#include <walras/debug.hpp>
#include <sstream>

namespace walras {

constexpr bool Selector::default_sanity_check;
constexpr std::array<double, 3> Selector::default_sample_endowments;

SelectedSolution::SelectedSolution(const algebra::Branch &branch, size_t index, bool proven, const std::vector<Warning> &warnings)
    : branch_(branch), index_(index), proven_(proven), warnings_(warnings) {}

const algebra::Branch& SelectedSolution::branch() const noexcept { return branch_; }
size_t SelectedSolution::index() const noexcept { return index_; }
bool SelectedSolution::proven() const noexcept { return proven_; }
const std::vector<Warning>& SelectedSolution::warnings() const noexcept { return warnings_; }

z3::expr SelectedSolution::operator[](const z3::expr &unknown) const {
    return branch_[unknown];
}

Eigen::VectorXd SelectedSolution::evaluate(const Bindings &b) const {
    return branch_.evaluate(b);
}

Selector::inadmissible::inadmissible(const std::string &what) : std::runtime_error(what) {}

Selector::Selector(const algebra::Engine &engine)
    : Selector(engine, default_sanity_check,
            std::vector<double>(default_sample_endowments.begin(), default_sample_endowments.end())) {}

Selector::Selector(const algebra::Engine &engine, bool sanity_check, const std::vector<double> &sample_endowments)
    : engine_(engine), sanity_check_(sanity_check), sample_endowments_(sample_endowments) {}

SelectedSolution Selector::select(const Model &model, const std::vector<algebra::Branch> &branches) const {
    if (branches.empty()) throw Solver::no_solution("No solution branches to select from");

    z3::expr_vector assumptions = model.assumptions();
    auto positive = [&](const algebra::Branch &b, const Parameter &p) -> bool {
        Truth t = engine_.isAlwaysTrue(b[p] > 0, assumptions);
        WALRAS_DBG(p.name() << " = " << b[p] << " > 0: " << (t == Truth::yes ? "yes" : t == Truth::no ? "no" : "unknown"));
        return t == Truth::yes;
    };

    bool found = false;
    size_t first = 0;
    for (size_t i = 0; i < branches.size(); i++) {
        const algebra::Branch &b = branches[i];
        if (not feasible(b, assumptions)) {
            WALRAS_DBG("branch " << i << " has unsatisfiable side conditions: " << b);
            continue;
        }
        if (not positive(b, model.py())) continue;
        if (not found) { found = true; first = i; }
        if (positive(b, model.px()) and positive(b, model.zAlpha()) and positive(b, model.zBeta())) {
            WALRAS_DBG("selected branch " << i << ": " << b);
            return SelectedSolution(b, i, true, {});
        }
    }
    if (found) {
        WALRAS_DBG("selected branch " << first << " (positive py only): " << branches[first]);
        return SelectedSolution(branches[first], first, true, {});
    }

    std::ostringstream msg;
    msg << "none of the " << branches.size() << " solution branch(es) has a provably positive py; "
        "falling back to the first one: " << branches.front();
    Warning w(Warning::Kind::ambiguous_positivity, msg.str());
    WALRAS_WARN(w);

    if (sanity_check_) checkNumerically(model, branches.front());
    return SelectedSolution(branches.front(), 0, false, {w});
}

bool Selector::feasible(const algebra::Branch &b, const z3::expr_vector &assumptions) const {
    if (b.conditions().size() == 0) return true;
    return engine_.isAlwaysTrue(not z3::mk_and(b.conditions()), assumptions) != Truth::yes;
}

void Selector::checkNumerically(const Model &model, const algebra::Branch &b) const {
    for (double k : sample_endowments_) {
        Eigen::VectorXd v = b.evaluate(model.bind(k));
        WALRAS_DBG("fallback branch at k = " << k << ": " << v.transpose());
        if (not v.allFinite() or (v.array() <= 0).any()) {
            std::ostringstream msg;
            msg << "Fallback solution branch is not admissible at k = " << k << ": values ["
                << v.transpose() << "] for " << b.unknowns();
            throw inadmissible(msg.str());
        }
    }
}

}
