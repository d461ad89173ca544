#include <ostream>

#include <indexgen/core/error.hh>
#include <indexgen/core/expression_function.hh>
#include <indexgen/core/function_buffer.hh>
#include <indexgen/core/function_type_registry.hh>

auto ixg::expression_function::operator()(index_type i) const -> value_type {
    if (!this->_expression) { throw_error("empty expression"); }
    return this->_expression->evaluate(i);
}

void ixg::expression_function::write(function_buffer& out) const {
    if (!this->_expression) { throw_error("empty expression"); }
    this->_expression->write(out);
}

void ixg::expression_function::read(function_buffer& in) {
    this->_expression = expressions::read(in, max_depth);
}

void ixg::expression_function::write(std::ostream& out) const {
    if (this->_expression) { out << *this->_expression; }
    else { out << "<empty>"; }
}

void ixg::add_builtin_types(function_type_registry& types) {
    types.add<expression_function>(expression_function_type_id);
}
