#include <walras/algebra/Z3Engine.hpp>
#include <walras/algebra/expression.hpp>
#include <walras/debug.hpp>
#include <boost/integer/common_factor_rt.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace walras { namespace algebra {

constexpr std::array<double, 3> Z3Engine::sample_points;

namespace {

typedef std::chrono::steady_clock steady;

// An unknown replaced by a root variable: unknown = root^degree
struct RootSubstitution {
    z3::expr unknown;
    z3::expr root;
    long degree;
};

struct Assignment {
    z3::expr var;
    z3::expr value;
};

// A partially eliminated system: the equations still to solve, the unknowns isolated so far (each
// in terms of unknowns isolated later) and the accumulated side conditions.
struct Partial {
    std::vector<z3::expr> equations;
    std::vector<Assignment> solved;
    std::vector<z3::expr> conditions;
};

// The lcm of the denominators of every fractional exponent applied directly to u
long root_degree(const z3::expr &e, const z3::expr &u) {
    if (not e.is_app()) return 1;
    long d = 1;
    if (e.decl().decl_kind() == Z3_OP_POWER and z3::eq(e.arg(0), u)) {
        boost::rational<long long> q;
        if (numeral_value(e.arg(1), q)) d = static_cast<long>(q.denominator());
    }
    for (unsigned i = 0; i < e.num_args(); i++)
        d = boost::integer::lcm(d, root_degree(e.arg(i), u));
    return d;
}

// Rewrites e with u = t^d, turning u^(p/q) into the integer power t^(pd/q)
z3::expr substitute_root(const z3::expr &e, const RootSubstitution &r) {
    if (z3::eq(e, r.unknown)) return integer_power(r.root, r.degree);
    if (not e.is_app() or e.num_args() == 0) return e;
    if (e.decl().decl_kind() == Z3_OP_POWER and z3::eq(e.arg(0), r.unknown)) {
        boost::rational<long long> q;
        if (numeral_value(e.arg(1), q)) {
            q *= r.degree;
            if (q.denominator() == 1) return integer_power(r.root, static_cast<long>(q.numerator()));
        }
    }
    std::vector<z3::expr> args;
    for (unsigned i = 0; i < e.num_args(); i++) args.push_back(substitute_root(e.arg(i), r));
    return rebuild(e, args);
}

class Eliminator {
    public:
        Eliminator(const std::vector<z3::expr> &unknowns, bool conditions, unsigned timeout_ms)
            : unknowns_(unknowns), conditions_(conditions), timeout_ms_(timeout_ms),
            deadline_(steady::now() + std::chrono::milliseconds(timeout_ms)) {}

        // Eliminates the partial system p, appending every completed branch to done
        void run(const Partial &p, std::vector<Partial> &done) const;

    private:
        bool solved(const Partial &p, const z3::expr &v) const {
            for (auto &s : p.solved) if (z3::eq(s.var, v)) return true;
            return false;
        }

        void checkDeadline() const {
            if (timeout_ms_ > 0 and steady::now() > deadline_)
                throw Engine::timeout(timeout_ms_);
        }

        // Continues with var = value, dropping equation eq and substituting into the others
        void branch(const Partial &p, size_t eq, const z3::expr &var, const z3::expr &value,
                const std::vector<z3::expr> &conditions, std::vector<Partial> &done) const;

        const std::vector<z3::expr> unknowns_;
        const bool conditions_;
        const unsigned timeout_ms_;
        const steady::time_point deadline_;
};

void Eliminator::branch(const Partial &p, size_t eq, const z3::expr &var, const z3::expr &value,
        const std::vector<z3::expr> &conditions, std::vector<Partial> &done) const {
    z3::expr_vector from(var.ctx()), to(var.ctx());
    from.push_back(var);
    to.push_back(value);

    Partial next;
    next.solved = p.solved;
    next.solved.push_back(Assignment{var, value});
    next.conditions = p.conditions;
    if (conditions_) next.conditions.insert(next.conditions.end(), conditions.begin(), conditions.end());
    for (size_t i = 0; i < p.equations.size(); i++) {
        if (i == eq) continue;
        z3::expr e = p.equations[i];
        next.equations.push_back(e.substitute(from, to));
    }

    WALRAS_DBG("isolated " << var << " = " << value);
    run(next, done);
}

void Eliminator::run(const Partial &p, std::vector<Partial> &done) const {
    checkDeadline();
    z3::context &ctx = unknowns_.front().ctx();

    // Normalize the remaining equations to numerator/denominator form
    Partial reduced;
    reduced.solved = p.solved;
    reduced.conditions = p.conditions;
    std::vector<z3::expr> nums, dens;
    for (auto &eq : p.equations) {
        Fraction f = together(eq);
        z3::expr n = expand(f.numerator);
        if (is_zero_numeral(n)) continue;
        if (n.is_numeral()) {
            WALRAS_DBG("inconsistent equation " << eq << " = 0, discarding branch");
            return;
        }
        bool has_unknown = false;
        for (auto &v : unknowns_) {
            if (not solved(p, v) and occurs(n, v)) { has_unknown = true; break; }
        }
        if (not has_unknown) {
            // Only constrains the free parameters
            if (conditions_) reduced.conditions.push_back(n == 0);
            continue;
        }
        reduced.equations.push_back(eq);
        nums.push_back(n);
        dens.push_back(f.denominator);
    }

    if (reduced.equations.empty()) {
        for (auto &v : unknowns_) {
            if (not solved(reduced, v))
                throw Engine::unsupported("system is underdetermined: nothing left to solve for " + v.to_string());
        }
        done.push_back(reduced);
        return;
    }

    // Isolate an unknown that appears linearly
    for (size_t i = 0; i < nums.size(); i++) {
        for (auto &v : unknowns_) {
            if (solved(reduced, v) or not occurs(nums[i], v)) continue;
            std::vector<z3::expr> c;
            if (not coefficients(nums[i], v, c) or c.size() != 2) continue;

            std::vector<z3::expr> conds{dens[i] != 0};
            if (not c[1].is_numeral()) conds.push_back(c[1] != 0);
            branch(reduced, i, v, (-c[0] / c[1]).simplify(), conds, done);
            return;
        }
    }

    // Solve an equation in a single unknown
    for (size_t i = 0; i < nums.size(); i++) {
        std::vector<z3::expr> present;
        for (auto &v : unknowns_) {
            if (not solved(reduced, v) and occurs(nums[i], v)) present.push_back(v);
        }
        if (present.size() != 1) continue;
        const z3::expr &v = present.front();
        std::vector<z3::expr> c;
        if (not coefficients(nums[i], v, c)) continue;

        std::vector<std::pair<z3::expr, std::vector<z3::expr>>> roots;

        // Strip factors of v.  v = 0 is a root only if the denominator doesn't vanish there.
        size_t low = 0;
        while (low < c.size() and is_zero_numeral(c[low])) low++;
        if (low > 0) {
            z3::expr_vector from(ctx), to(ctx);
            from.push_back(v);
            to.push_back(ctx.real_val(0));
            z3::expr d0 = dens[i];
            d0 = d0.substitute(from, to).simplify();
            if (not is_zero_numeral(d0))
                roots.emplace_back(ctx.real_val(0), std::vector<z3::expr>());
            c.erase(c.begin(), c.begin() + low);
        }

        const size_t degree = c.size() - 1;
        if (degree > 2)
            throw Engine::unsupported("cannot solve `" + reduced.equations[i].to_string() + " = 0' of degree "
                    + std::to_string(degree) + " in " + v.to_string());

        std::vector<z3::expr> conds;
        if (degree >= 1 and not c[degree].is_numeral()) conds.push_back(c[degree] != 0);
        if (degree == 1) {
            roots.emplace_back((-c[0] / c[1]).simplify(), conds);
        }
        else if (degree == 2) {
            const z3::expr &a = c[2], &b = c[1], &cc = c[0];
            z3::expr disc = expand(b*b - 4*a*cc);
            boost::rational<long long> dv;
            bool numeric_disc = numeral_value(disc, dv);
            if (numeric_disc and dv == 0) {
                roots.emplace_back((-b / (2*a)).simplify(), conds);
            }
            else if (not numeric_disc or dv > 0) {
                z3::expr sq = rational_power(disc, boost::rational<int>(1, 2));
                if (not numeric_disc) conds.push_back(disc >= 0);
                roots.emplace_back(((-b - sq) / (2*a)).simplify(), conds);
                roots.emplace_back(((-b + sq) / (2*a)).simplify(), conds);
            }
            // A negative numeric discriminant: no real roots
        }

        for (auto &r : roots) {
            std::vector<z3::expr> rc = r.second;
            rc.push_back(dens[i] != 0);
            branch(reduced, i, v, r.first, rc, done);
        }
        return;
    }

    std::string remaining;
    for (auto &eq : reduced.equations) remaining += "\n    " + eq.to_string() + " = 0";
    throw Engine::unsupported("no unknown can be isolated in the remaining equations:" + remaining);
}

// Recovers a rational with denominator at most max_den close to x, via continued fractions
bool rationalize(double x, long long max_den, boost::rational<long long> &out) {
    const double tol = 1e-10 * std::max(1.0, std::fabs(x));
    if (not std::isfinite(x) or std::fabs(x) > 1e12) return false;

    long long h0 = 0, h1 = 1, k0 = 1, k1 = 0;
    double r = x;
    for (int i = 0; i < 64; i++) {
        double a = std::floor(r);
        long long ai = static_cast<long long>(a);
        long long h2 = ai*h1 + h0, k2 = ai*k1 + k0;
        if (k2 > max_den) return false;
        h0 = h1; h1 = h2; k0 = k1; k1 = k2;
        if (std::fabs(x - static_cast<double>(h1) / k1) <= tol) {
            out = boost::rational<long long>(h1, k1);
            return true;
        }
        double frac = r - a;
        if (frac <= 0) return false;
        r = 1 / frac;
    }
    return false;
}

z3::expr numeral(z3::context &ctx, const boost::rational<long long> &q) {
    return ctx.real_val((std::to_string(q.numerator()) + "/" + std::to_string(q.denominator())).c_str());
}

// c * b, leaving out a coefficient of 1 or -1
z3::expr scaled(const boost::rational<long long> &c, const z3::expr &b) {
    if (c == 1) return b;
    if (c == -1) return -b;
    return numeral(b.ctx(), c) * b;
}

// Fits c x^e through the values v sampled at Z3Engine::sample_points, for a simple rational
// exponent e != 0 and a coefficient c that is rational or the square root of a rational (the latter
// folded into the radical (c^2 x^(2e))^(1/2)).  Returns false if no such monomial matches every sample.
bool fit_monomial(const std::vector<double> &v, const z3::expr &x, z3::expr &fitted) {
    const auto &p = Z3Engine::sample_points;
    if (v.size() != p.size()) return false;
    for (double vi : v) {
        if (vi == 0 or (vi > 0) != (v.front() > 0)) return false;
    }
    const long long sign = v.front() > 0 ? 1 : -1;

    boost::rational<long long> e;
    if (not rationalize(std::log(v[1] / v[0]) / std::log(p[1] / p[0]), 12, e)
            or e == 0 or std::abs(e.numerator()) > 12)
        return false;
    const double ed = boost::rational_cast<double>(e);
    const double c = std::fabs(v[0]) / std::pow(p[0], ed);
    for (size_t i = 0; i < p.size(); i++) {
        if (std::fabs(sign * c * std::pow(p[i], ed) - v[i]) > 1e-9 * std::max(1.0, std::fabs(v[i])))
            return false;
    }

    boost::rational<long long> cq;
    if (rationalize(c, 10000, cq)) {
        boost::rational<int> ei(static_cast<int>(e.numerator()), static_cast<int>(e.denominator()));
        fitted = scaled(sign * cq, rational_power(x, ei));
        return true;
    }
    const boost::rational<long long> e2 = e * 2LL;
    if (e2.denominator() == 1 and rationalize(c * c, 10000, cq)) {
        z3::expr radicand = scaled(cq, integer_power(x, static_cast<long>(e2.numerator())));
        fitted = scaled(boost::rational<long long>(sign), rational_power(radicand, boost::rational<int>(1, 2)));
        return true;
    }
    return false;
}

}

Z3Engine::Z3Engine(unsigned timeout_ms) : timeout_ms_(timeout_ms) {}

unsigned Z3Engine::timeoutMs() const noexcept {
    return timeout_ms_;
}

std::vector<Branch> Z3Engine::solve(
        const std::vector<Equation> &equations,
        const z3::expr_vector &unknowns,
        const Options &options) const {
    if (unknowns.size() == 0) throw unsupported("no unknowns given");
    z3::context &ctx = unknowns[0].ctx();

    try {
        std::vector<z3::expr> diffs;
        for (auto &eq : equations) diffs.push_back(eq.difference());

        // Replace unknowns appearing under fractional powers by root variables
        std::vector<RootSubstitution> roots;
        std::vector<z3::expr> elim_unknowns, start_conditions;
        for (unsigned i = 0; i < unknowns.size(); i++) {
            z3::expr u = unknowns[i];
            long d = 1;
            for (auto &e : diffs) d = boost::integer::lcm(d, root_degree(e, u));
            if (d == 1) {
                elim_unknowns.push_back(u);
                continue;
            }
            z3::expr t = ctx.real_const(("__" + u.decl().name().str() + "_root").c_str());
            RootSubstitution r{u, t, d};
            for (auto &e : diffs) e = substitute_root(e, r);
            if (d % 2 == 0) start_conditions.push_back(t >= 0);
            roots.push_back(r);
            elim_unknowns.push_back(t);
            WALRAS_DBG("substituted " << u << " = " << integer_power(t, d));
        }

        Partial start;
        start.equations = diffs;
        if (options.conditions) start.conditions = start_conditions;

        std::vector<Partial> done;
        Eliminator(elim_unknowns, options.conditions, options.timeout_ms).run(start, done);

        std::vector<Branch> branches;
        for (auto &p : done) {
            // Back-substitute: each value only involves unknowns isolated after it
            z3::expr_vector from(ctx), to(ctx);
            for (auto it = p.solved.rbegin(); it != p.solved.rend(); ++it) {
                z3::expr value = it->value;
                z3::expr resolved_value = value.substitute(from, to);
                from.push_back(it->var);
                to.push_back(resolved_value);
            }
            auto resolved = [&](const z3::expr &v) -> z3::expr {
                for (unsigned j = 0; j < from.size(); j++) if (z3::eq(from[j], v)) return to[j];
                throw unsupported("no value found for " + v.to_string());
            };

            z3::expr_vector values(ctx);
            for (unsigned i = 0; i < unknowns.size(); i++) {
                z3::expr u = unknowns[i];
                z3::expr value = u;
                bool rooted = false;
                for (auto &r : roots) {
                    if (z3::eq(r.unknown, u)) {
                        value = integer_power(resolved(r.root), r.degree);
                        rooted = true;
                    }
                }
                if (not rooted) value = resolved(u);
                values.push_back(value.simplify());
            }

            z3::expr_vector conditions(ctx);
            bool possible = true;
            for (auto &c : p.conditions) {
                z3::expr s = c;
                s = s.substitute(from, to).simplify();
                if (s.is_true()) continue;
                if (s.is_false()) { possible = false; break; }
                conditions.push_back(s);
            }
            if (not possible) {
                WALRAS_DBG("dropping branch with a false side condition");
                continue;
            }
            branches.emplace_back(unknowns, values, conditions);
            WALRAS_DBG("branch " << branches.size() << ": " << branches.back());
        }
        return branches;
    }
    catch (const z3::exception &e) {
        throw unsupported(e.msg());
    }
}

Truth Z3Engine::isAlwaysTrue(const z3::expr &claim, const z3::expr_vector &assumptions) const {
    z3::context &ctx = claim.ctx();
    try {
        Purifier purify(ctx);
        z3::solver s(ctx, "QF_NRA");
        if (timeout_ms_ > 0) {
            z3::params p(ctx);
            p.set("timeout", timeout_ms_);
            s.set(p);
        }
        for (unsigned i = 0; i < assumptions.size(); i++) s.add(purify(assumptions[i]));
        s.add(not purify(claim));
        const z3::expr_vector &constraints = purify.constraints();
        for (unsigned i = 0; i < constraints.size(); i++) s.add(constraints[i]);

        switch (s.check()) {
            case z3::unsat: return Truth::yes;
            case z3::sat:   return Truth::no;
            default:
                WALRAS_DBG("undecided: " << claim << " (" << s.reason_unknown() << ")");
                return Truth::unknown;
        }
    }
    catch (const z3::exception &e) {
        throw unsupported(e.msg());
    }
}

z3::expr Z3Engine::simplify(const z3::expr &e, const z3::expr_vector &assumptions) const {
    z3::expr s = e.simplify();
    if (not s.is_real() or s.is_numeral()) return s;

    std::vector<z3::expr> symbols = free_symbols(s);
    std::vector<double> values;
    for (double point : sample_points) {
        Bindings b;
        for (size_t i = 0; i < symbols.size(); i++)
            b[symbols[i].decl().name().str()] = point + 0.25 * i;
        double v;
        try {
            v = evaluate(s, b);
        }
        catch (const std::domain_error&) {
            // Something without a numeric value: no closed form to recover
            return s;
        }
        if (not std::isfinite(v)) return s;
        values.push_back(v);
    }

    bool constant = true;
    for (double v : values) {
        if (std::fabs(v - values.front()) > 1e-9 * std::max(1.0, std::fabs(values.front()))) constant = false;
    }

    z3::expr candidate = s;
    if (constant) {
        boost::rational<long long> c;
        if (not rationalize(values.front(), 10000, c)) return s;
        candidate = numeral(s.ctx(), c);
    }
    else if (symbols.size() != 1 or not fit_monomial(values, symbols.front(), candidate)) {
        return s;
    }

    if (isAlwaysTrue(s == candidate, assumptions) == Truth::yes) {
        WALRAS_DBG(s << " simplified to " << candidate);
        return candidate;
    }
    return s;
}

} }
