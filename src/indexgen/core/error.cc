#include <ostream>

#include <indexgen/core/error.hh>

std::ostream& ixg::operator<<(std::ostream& out, const error& rhs) {
    return out << rhs.what();
}
