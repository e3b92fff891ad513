#include <walras/Warning.hpp>

namespace walras {

Warning::Warning(Kind kind, const std::string &message) : kind_(kind), message_(message) {}

Warning::Kind Warning::kind() const noexcept { return kind_; }

const std::string& Warning::message() const noexcept { return message_; }

std::ostream& operator<<(std::ostream &os, Warning::Kind kind) {
    switch (kind) {
        case Warning::Kind::ambiguous_positivity: return os << "ambiguous_positivity";
        case Warning::Kind::market_not_clearing:  return os << "market_not_clearing";
    }
    return os;
}

std::ostream& operator<<(std::ostream &os, const Warning &w) {
    return os << w.kind() << ": " << w.message();
}

}
