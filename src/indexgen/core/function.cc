#include <ostream>
#include <typeinfo>

#include <indexgen/core/function.hh>
#include <indexgen/core/function_buffer.hh>

void ixg::function_base::write(function_buffer&) const {}
void ixg::function_base::read(function_buffer&) {}

void ixg::function_base::write(std::ostream& out) const {
    out << typeid(*this).name();
}

std::ostream& ixg::operator<<(std::ostream& out, const function_base& rhs) {
    rhs.write(out);
    return out;
}
