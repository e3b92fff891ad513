#pragma once
#include <ostream>
#include <string>

namespace walras {

/** A non-fatal condition met by the pipeline, attached as metadata to its outputs.  The pipeline
 * keeps going after a warning; every warning is also written to std::cerr with WALRAS_WARN when
 * it is raised.
 */
class Warning final {
    public:
        /// The kinds of non-fatal conditions.
        enum class Kind {
            /// No solution branch could be proven admissible; the first branch was used anyway.
            ambiguous_positivity,
            /// A market's excess demand could not be shown to vanish identically.
            market_not_clearing
        };

        /// Creates a warning of the given kind with a descriptive message.
        Warning(Kind kind, const std::string &message);

        /// The warning kind
        Kind kind() const noexcept;

        /// The descriptive message
        const std::string& message() const noexcept;

    private:
        Kind kind_;
        std::string message_;
};

/// Prints the kind name (e.g. `ambiguous_positivity`)
std::ostream& operator<<(std::ostream &os, Warning::Kind kind);

/// Prints `kind: message`
std::ostream& operator<<(std::ostream &os, const Warning &w);

}
