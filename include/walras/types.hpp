#pragma once
#include <string>
#include <unordered_map>

/** \file walras/types.hpp basic types and forward declarations
 *
 * This header includes the Domain, Role and Truth enums, the Bindings type used for numeric
 * evaluation, and forward-declares the top-level walras types (so as to avoid nested header
 * problems).
 */

namespace walras {

/** The domain restriction of a symbolic Parameter. */
enum class Domain {
    unrestricted, ///< No restriction (a complex-valued symbol in principle)
    real,         ///< Any real value
    positive      ///< Strictly positive real values
};

/** The role a Parameter plays in the Model. */
enum class Role {
    unknown,   ///< Endogenous: solved for by the Solver
    exogenous, ///< Free parameter left symbolic in every result (the endowment)
    numeraire  ///< Fixed to 1 at construction; never a free symbol
};

/** Three-valued result of a symbolic truth query.  `unknown` means the algebra engine could
 * neither prove nor refute the claim (including when the query timed out).
 */
enum class Truth { yes, no, unknown };

/** Numeric values for symbols, keyed by symbol name, used when evaluating closed forms. */
typedef std::unordered_map<std::string, double> Bindings;

class Parameter;
struct Equation;
class Firm;
class Consumer;
class Model;
class Warning;
class Solver;
class Selector;
class SelectedSolution;
class Verifier;
class WelfareResult;
class Equilibrium;

namespace algebra {
class Branch;
class Engine;
class Z3Engine;
}

}
