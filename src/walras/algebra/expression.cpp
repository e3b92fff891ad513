#include <walras/algebra/expression.hpp>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace walras { namespace algebra {

unbound_symbol::unbound_symbol(const std::string &name)
    : std::runtime_error("Unbound symbol `" + name + "' in numeric evaluation") {}

namespace {

Z3_decl_kind kind(const z3::expr &e) {
    return e.is_app() ? e.decl().decl_kind() : Z3_OP_INTERNAL;
}

bool is_symbol(const z3::expr &e) {
    return e.is_app() and e.num_args() == 0 and e.decl().decl_kind() == Z3_OP_UNINTERPRETED;
}

// Multiplies, skipping numeral 1 factors (together() would otherwise pile them up)
z3::expr times(const z3::expr &a, const z3::expr &b) {
    if (is_one_numeral(a)) return b;
    if (is_one_numeral(b)) return a;
    return a * b;
}

// Accumulates the degree in var and the var-free cofactor of a single monomial.  Returns false if
// the monomial is not polynomial in var.
bool monomial(const z3::expr &t, const z3::expr &var, long &degree, z3::expr &cofactor) {
    if (z3::eq(t, var)) {
        degree += 1;
        return true;
    }
    switch (kind(t)) {
        case Z3_OP_MUL:
            for (unsigned i = 0; i < t.num_args(); i++) {
                if (not monomial(t.arg(i), var, degree, cofactor)) return false;
            }
            return true;
        case Z3_OP_UMINUS:
            cofactor = -cofactor;
            return monomial(t.arg(0), var, degree, cofactor);
        case Z3_OP_POWER:
            if (z3::eq(t.arg(0), var)) {
                boost::rational<long long> n;
                if (not numeral_value(t.arg(1), n) or n.denominator() != 1 or n.numerator() < 0)
                    return false;
                degree += n.numerator();
                return true;
            }
            break;
        default:
            break;
    }
    if (occurs(t, var)) return false;
    cofactor = times(cofactor, t);
    return true;
}

void collect_symbols(const z3::expr &e, std::vector<z3::expr> &found) {
    if (is_symbol(e)) {
        for (auto &f : found) if (z3::eq(f, e)) return;
        found.push_back(e);
    }
    else if (e.is_app()) {
        for (unsigned i = 0; i < e.num_args(); i++) collect_symbols(e.arg(i), found);
    }
}

}

z3::expr integer_power(const z3::expr &base, long n) {
    if (n == 0) return base.ctx().real_val(1);
    if (n < 0) return base.ctx().real_val(1) / integer_power(base, -n);
    z3::expr r = base;
    for (long i = 1; i < n; i++) r = r * base;
    return r;
}

z3::expr rational_power(const z3::expr &base, const boost::rational<int> &e) {
    if (e.denominator() == 1) return integer_power(base, e.numerator());
    return z3::pw(base, base.ctx().real_val(e.numerator(), e.denominator()));
}

bool numeral_value(const z3::expr &e, boost::rational<long long> &value) {
    std::string s;
    if (not e.is_numeral(s)) return false;
    auto slash = s.find('/');
    try {
        long long num = std::stoll(s.substr(0, slash));
        long long den = slash == std::string::npos ? 1 : std::stoll(s.substr(slash + 1));
        value = boost::rational<long long>(num, den);
    }
    catch (const std::out_of_range&) {
        return false;
    }
    catch (const std::invalid_argument&) {
        // Decimal or algebraic forms: not an exact rational we can represent
        return false;
    }
    return true;
}

bool is_zero_numeral(const z3::expr &e) {
    boost::rational<long long> v;
    return numeral_value(e, v) and v == 0;
}

bool is_one_numeral(const z3::expr &e) {
    boost::rational<long long> v;
    return numeral_value(e, v) and v == 1;
}

bool occurs(const z3::expr &e, const z3::expr &var) {
    if (z3::eq(e, var)) return true;
    if (not e.is_app()) return false;
    for (unsigned i = 0; i < e.num_args(); i++) {
        if (occurs(e.arg(i), var)) return true;
    }
    return false;
}

std::vector<z3::expr> free_symbols(const z3::expr &e) {
    std::vector<z3::expr> found;
    collect_symbols(e, found);
    return found;
}

z3::expr rebuild(const z3::expr &e, const std::vector<z3::expr> &args) {
    if (args.empty()) return e;
    z3::context &ctx = e.ctx();
    switch (kind(e)) {
        case Z3_OP_ADD:
        case Z3_OP_SUB:
        case Z3_OP_MUL: {
            z3::expr r = args[0];
            for (size_t i = 1; i < args.size(); i++) {
                auto k = kind(e);
                r = k == Z3_OP_ADD ? r + args[i] : k == Z3_OP_SUB ? r - args[i] : r * args[i];
            }
            return r;
        }
        case Z3_OP_UMINUS:  return -args[0];
        case Z3_OP_DIV:     return args[0] / args[1];
        case Z3_OP_POWER:   return z3::pw(args[0], args[1]);
        case Z3_OP_TO_REAL: return z3::to_real(args[0]);
        case Z3_OP_LE:      return args[0] <= args[1];
        case Z3_OP_GE:      return args[0] >= args[1];
        case Z3_OP_LT:      return args[0] < args[1];
        case Z3_OP_GT:      return args[0] > args[1];
        case Z3_OP_EQ:      return args[0] == args[1];
        case Z3_OP_NOT:     return not args[0];
        case Z3_OP_IMPLIES: return z3::implies(args[0], args[1]);
        case Z3_OP_ITE:     return z3::ite(args[0], args[1], args[2]);
        case Z3_OP_AND:
        case Z3_OP_OR:
        case Z3_OP_DISTINCT: {
            z3::expr_vector v(ctx);
            for (auto &a : args) v.push_back(a);
            auto k = kind(e);
            return k == Z3_OP_AND ? z3::mk_and(v) : k == Z3_OP_OR ? z3::mk_or(v) : z3::distinct(v);
        }
        default: {
            z3::expr_vector v(ctx);
            for (auto &a : args) v.push_back(a);
            return e.decl()(v);
        }
    }
}

Fraction together(const z3::expr &e) {
    z3::expr one = e.ctx().real_val(1);
    if (not e.is_app() or e.num_args() == 0) return Fraction{e, one};

    switch (kind(e)) {
        case Z3_OP_ADD:
        case Z3_OP_SUB: {
            bool add = kind(e) == Z3_OP_ADD;
            Fraction acc = together(e.arg(0));
            for (unsigned i = 1; i < e.num_args(); i++) {
                Fraction f = together(e.arg(i));
                z3::expr left = times(acc.numerator, f.denominator), right = times(f.numerator, acc.denominator);
                acc.numerator = add ? left + right : left - right;
                acc.denominator = times(acc.denominator, f.denominator);
            }
            return acc;
        }
        case Z3_OP_UMINUS: {
            Fraction f = together(e.arg(0));
            return Fraction{-f.numerator, f.denominator};
        }
        case Z3_OP_MUL: {
            Fraction acc = together(e.arg(0));
            for (unsigned i = 1; i < e.num_args(); i++) {
                Fraction f = together(e.arg(i));
                acc.numerator = times(acc.numerator, f.numerator);
                acc.denominator = times(acc.denominator, f.denominator);
            }
            return acc;
        }
        case Z3_OP_DIV: {
            Fraction a = together(e.arg(0)), b = together(e.arg(1));
            return Fraction{times(a.numerator, b.denominator), times(a.denominator, b.numerator)};
        }
        case Z3_OP_POWER: {
            boost::rational<long long> q;
            if (numeral_value(e.arg(1), q) and q.denominator() == 1) {
                Fraction f = together(e.arg(0));
                long n = static_cast<long>(q.numerator());
                if (n >= 0) return Fraction{integer_power(f.numerator, n), integer_power(f.denominator, n)};
                return Fraction{integer_power(f.denominator, -n), integer_power(f.numerator, -n)};
            }
            return Fraction{e, one};
        }
        case Z3_OP_TO_REAL:
            return together(e.arg(0));
        default:
            return Fraction{e, one};
    }
}

z3::expr expand(const z3::expr &e) {
    z3::params p(e.ctx());
    p.set("som", true);
    return e.simplify(p);
}

bool coefficients(const z3::expr &poly, const z3::expr &var, std::vector<z3::expr> &coefs) {
    const long max_degree = 64;
    z3::context &ctx = poly.ctx();

    std::vector<z3::expr> terms;
    if (kind(poly) == Z3_OP_ADD) {
        for (unsigned i = 0; i < poly.num_args(); i++) terms.push_back(poly.arg(i));
    }
    else terms.push_back(poly);

    coefs.clear();
    for (auto &t : terms) {
        long degree = 0;
        z3::expr cofactor = ctx.real_val(1);
        if (not monomial(t, var, degree, cofactor) or degree > max_degree) return false;
        while (coefs.size() <= static_cast<size_t>(degree)) coefs.push_back(ctx.real_val(0));
        coefs[degree] = coefs[degree] + cofactor;
    }
    for (auto &c : coefs) c = expand(c);
    while (not coefs.empty() and is_zero_numeral(coefs.back())) coefs.pop_back();
    return true;
}

double evaluate(const z3::expr &e, const Bindings &b) {
    if (e.is_numeral() or e.is_algebraic()) {
        std::string s = e.get_decimal_string(20);
        // Z3 marks truncated decimal expansions with a trailing '?'
        if (not s.empty() and s.back() == '?') s.pop_back();
        return std::strtod(s.c_str(), nullptr);
    }
    if (is_symbol(e)) {
        std::string name = e.decl().name().str();
        auto found = b.find(name);
        if (found == b.end()) throw unbound_symbol(name);
        return found->second;
    }

    switch (kind(e)) {
        case Z3_OP_ADD: {
            double sum = 0;
            for (unsigned i = 0; i < e.num_args(); i++) sum += evaluate(e.arg(i), b);
            return sum;
        }
        case Z3_OP_SUB: {
            double diff = evaluate(e.arg(0), b);
            for (unsigned i = 1; i < e.num_args(); i++) diff -= evaluate(e.arg(i), b);
            return diff;
        }
        case Z3_OP_MUL: {
            double prod = 1;
            for (unsigned i = 0; i < e.num_args(); i++) prod *= evaluate(e.arg(i), b);
            return prod;
        }
        case Z3_OP_UMINUS:  return -evaluate(e.arg(0), b);
        case Z3_OP_DIV:     return evaluate(e.arg(0), b) / evaluate(e.arg(1), b);
        case Z3_OP_POWER:   return std::pow(evaluate(e.arg(0), b), evaluate(e.arg(1), b));
        case Z3_OP_TO_REAL: return evaluate(e.arg(0), b);
        default:
            throw std::domain_error("Cannot evaluate `" + e.to_string() + "' numerically");
    }
}

Purifier::Purifier(z3::context &ctx) : ctx_(ctx), constraints_(ctx), radicands_(ctx) {}

const z3::expr_vector& Purifier::constraints() const noexcept {
    return constraints_;
}

z3::expr Purifier::operator()(const z3::expr &e) {
    if (not e.is_app() or e.num_args() == 0) return e;

    std::vector<z3::expr> args;
    for (unsigned i = 0; i < e.num_args(); i++) args.push_back((*this)(e.arg(i)));

    if (kind(e) == Z3_OP_POWER) {
        boost::rational<long long> q;
        if (numeral_value(args[1], q)) {
            long p = static_cast<long>(q.numerator());
            if (q.denominator() == 1) return integer_power(args[0], p);
            return integer_power(root(args[0], static_cast<long>(q.denominator())), p);
        }
    }
    return rebuild(e, args);
}

z3::expr Purifier::root(const z3::expr &radicand, long degree) {
    auto key = std::make_pair(Z3_get_ast_id(ctx_, radicand), degree);
    auto found = roots_.find(key);
    if (found != roots_.end()) return found->second;

    std::ostringstream name;
    name << "__root" << roots_.size();
    z3::expr r = ctx_.real_const(name.str().c_str());
    constraints_.push_back(integer_power(r, degree) == radicand);
    if (degree % 2 == 0) constraints_.push_back(r >= 0);

    // AST ids are only stable while the AST is alive
    radicands_.push_back(radicand);
    roots_.emplace(key, r);
    return r;
}

} }
