#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include <indexgen/core/error.hh>
#include <indexgen/core/expressions.hh>

namespace {

    using ixg::expressions::value_type;

    inline bool is_space(char ch) noexcept {
        return std::isspace(static_cast<unsigned char>(ch)) != 0;
    }

    inline void trim(const char** first_inout, const char** last_inout) {
        auto first = *first_inout, last = *last_inout;
        while (first != last && is_space(*first)) { ++first; }
        *first_inout = first;
        while (first != last && is_space(*(last-1))) { --last; }
        *last_inout = last;
    }

    /// Finds the end of the first argument in [first,last).
    inline const char* argument_end(const char* first, const char* last) {
        int bracket = 0;
        auto ptr = first;
        while (ptr != last && (bracket != 0 || !is_space(*ptr))) {
            if (*ptr == '(') { ++bracket; }
            else if (*ptr == ')') { --bracket; }
            if (bracket < 0) { throw std::invalid_argument("unbalanced brackets"); }
            ++ptr;
        }
        if (bracket != 0) { throw std::invalid_argument("unbalanced brackets"); }
        return ptr;
    }

    inline ixg::expressions::expression_ptr
    read_expression(const char* first, const char* last, int depth) {
        using namespace ixg::expressions;
        trim(&first, &last);
        auto name_last = first;
        while (name_last != last && !is_space(*name_last)) { ++name_last; }
        std::string name(first, name_last);
        while (name_last != last && is_space(*name_last)) { ++name_last; }
        if (name == "negate") {
            return expression_ptr(new Negate(read(name_last, last, depth-1)));
        }
        auto ptr = argument_end(name_last, last);
        if (ptr == last) { throw std::invalid_argument("expected two arguments"); }
        auto arg0 = read(name_last, ptr, depth-1);
        auto arg1 = read(ptr, last, depth-1);
        if (name == "+") {
            return expression_ptr(new Add(std::move(arg0), std::move(arg1)));
        } else if (name == "-") {
            return expression_ptr(new Subtract(std::move(arg0), std::move(arg1)));
        } else if (name == "*") {
            return expression_ptr(new Multiply(std::move(arg0), std::move(arg1)));
        } else if (name == "quotient") {
            return expression_ptr(new Quotient(std::move(arg0), std::move(arg1)));
        } else if (name == "remainder") {
            return expression_ptr(new Remainder(std::move(arg0), std::move(arg1)));
        } else if (name == "min") {
            return expression_ptr(new Minimum(std::move(arg0), std::move(arg1)));
        } else if (name == "max") {
            return expression_ptr(new Maximum(std::move(arg0), std::move(arg1)));
        }
        throw std::invalid_argument("unknown operation \"" + name + "\"");
    }

    inline ixg::expressions::value_type
    read_constant(const char* first, const char* last) {
        std::string s(first, last);
        std::size_t n = 0;
        ixg::expressions::value_type value = 0;
        try {
            value = std::stoll(s, &n);
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("constant is out of range \"" + s + "\"");
        }
        if (n != s.size()) { throw std::invalid_argument("bad constant \"" + s + "\""); }
        return value;
    }

    inline void check_divisor(value_type a, value_type b) {
        if (b == 0) { ixg::throw_error("division by zero"); }
        if (b == -1 && a == std::numeric_limits<value_type>::min()) {
            ixg::throw_error("integer overflow");
        }
    }

    inline void check_overflow(bool overflow) {
        if (overflow) { ixg::throw_error("integer overflow"); }
    }

}

auto ixg::expressions::Index::evaluate(index_type i) const -> value_type {
    return i;
}
auto ixg::expressions::Constant::evaluate(index_type) const -> value_type {
    return this->_value;
}
auto ixg::expressions::Negate::evaluate(index_type i) const -> value_type {
    value_type result = 0;
    check_overflow(__builtin_sub_overflow(value_type(0), this->_arg->evaluate(i), &result));
    return result;
}
auto ixg::expressions::Add::evaluate(index_type i) const -> value_type {
    value_type result = 0;
    check_overflow(__builtin_add_overflow(this->_a->evaluate(i), this->_b->evaluate(i),
                                         &result));
    return result;
}
auto ixg::expressions::Subtract::evaluate(index_type i) const -> value_type {
    value_type result = 0;
    check_overflow(__builtin_sub_overflow(this->_a->evaluate(i), this->_b->evaluate(i),
                                         &result));
    return result;
}
auto ixg::expressions::Multiply::evaluate(index_type i) const -> value_type {
    value_type result = 0;
    check_overflow(__builtin_mul_overflow(this->_a->evaluate(i), this->_b->evaluate(i),
                                         &result));
    return result;
}
auto ixg::expressions::Quotient::evaluate(index_type i) const -> value_type {
    auto a = this->_a->evaluate(i);
    auto b = this->_b->evaluate(i);
    check_divisor(a, b);
    return a / b;
}
auto ixg::expressions::Remainder::evaluate(index_type i) const -> value_type {
    auto a = this->_a->evaluate(i);
    auto b = this->_b->evaluate(i);
    check_divisor(a, b);
    return a % b;
}
auto ixg::expressions::Minimum::evaluate(index_type i) const -> value_type {
    return std::min(this->_a->evaluate(i), this->_b->evaluate(i));
}
auto ixg::expressions::Maximum::evaluate(index_type i) const -> value_type {
    return std::max(this->_a->evaluate(i), this->_b->evaluate(i));
}

void ixg::expressions::Index::write(sys::byte_buffer& out) const {
    out.write(Expressions::Index);
}
void ixg::expressions::Index::read(sys::byte_buffer&, int) {}
void ixg::expressions::Index::write(std::ostream& out) const { out << 'i'; }

void ixg::expressions::Constant::write(sys::byte_buffer& out) const {
    out.write(Expressions::Constant);
    out.write(this->_value);
}
void ixg::expressions::Constant::read(sys::byte_buffer& in, int) { in.read(this->_value); }
void ixg::expressions::Constant::write(std::ostream& out) const { out << this->_value; }

void ixg::expressions::Negate::write(sys::byte_buffer& out) const {
    out.write(Expressions::Negate);
    this->_arg->write(out);
}
void ixg::expressions::Negate::read(sys::byte_buffer& in, int depth) {
    this->_arg = ::ixg::expressions::read(in, depth);
}
void ixg::expressions::Negate::write(std::ostream& out) const {
    out << "(negate " << *this->_arg << ')';
}

#define IXG_EXPRESSIONS_BINARY_OPERATION_IO(NAME, HUMAN_NAME) \
    void ixg::expressions::NAME::write(sys::byte_buffer& out) const { \
        out.write(Expressions::NAME); \
        this->_a->write(out); \
        this->_b->write(out); \
    } \
    void ixg::expressions::NAME::read(sys::byte_buffer& in, int depth) { \
        this->_a = ::ixg::expressions::read(in, depth); \
        this->_b = ::ixg::expressions::read(in, depth); \
    } \
    void ixg::expressions::NAME::write(std::ostream& out) const { \
        out << "(" HUMAN_NAME " " << *this->_a << ' ' << *this->_b << ')'; \
    }

IXG_EXPRESSIONS_BINARY_OPERATION_IO(Add, "+");
IXG_EXPRESSIONS_BINARY_OPERATION_IO(Subtract, "-");
IXG_EXPRESSIONS_BINARY_OPERATION_IO(Multiply, "*");
IXG_EXPRESSIONS_BINARY_OPERATION_IO(Quotient, "quotient");
IXG_EXPRESSIONS_BINARY_OPERATION_IO(Remainder, "remainder");
IXG_EXPRESSIONS_BINARY_OPERATION_IO(Minimum, "min");
IXG_EXPRESSIONS_BINARY_OPERATION_IO(Maximum, "max");

#undef IXG_EXPRESSIONS_BINARY_OPERATION_IO

auto ixg::expressions::make_expression(Expressions type) -> expression_ptr {
    switch (type) {
        case Expressions::Index: return expression_ptr(new Index);
        case Expressions::Constant: return expression_ptr(new Constant);
        case Expressions::Negate: return expression_ptr(new Negate);
        case Expressions::Add: return expression_ptr(new Add);
        case Expressions::Subtract: return expression_ptr(new Subtract);
        case Expressions::Multiply: return expression_ptr(new Multiply);
        case Expressions::Quotient: return expression_ptr(new Quotient);
        case Expressions::Remainder: return expression_ptr(new Remainder);
        case Expressions::Minimum: return expression_ptr(new Minimum);
        case Expressions::Maximum: return expression_ptr(new Maximum);
        default: throw std::invalid_argument("bad expression type");
    }
}

auto ixg::expressions::read(sys::byte_buffer& in, int depth) -> expression_ptr {
    if (depth <= 0) { throw std::invalid_argument("expression is too deep"); }
    Expressions type{};
    in.read(type);
    auto result = make_expression(type);
    result->read(in, depth-1);
    return result;
}

auto ixg::expressions::read(const char* first, const char* last, int depth) -> expression_ptr {
    if (depth <= 0) { throw std::invalid_argument("expression is too deep"); }
    trim(&first, &last);
    if (first == last) { throw std::invalid_argument("empty expression"); }
    if (*first == '(' && last[-1] == ')') {
        return read_expression(first+1, last-1, depth);
    }
    if (last-first == 1 && *first == 'i') { return expression_ptr(new Index); }
    return expression_ptr(new Constant(read_constant(first, last)));
}

auto ixg::expressions::read(std::istream& in, int max_depth) -> expression_ptr {
    std::stringstream tmp;
    tmp << in.rdbuf();
    auto s = tmp.str();
    return read(s.data(), s.data()+s.size(), max_depth);
}
