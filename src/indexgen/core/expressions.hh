#ifndef INDEXGEN_CORE_EXPRESSIONS_HH
#define INDEXGEN_CORE_EXPRESSIONS_HH

#include <iosfwd>
#include <memory>
#include <string>

#include <unistdx/base/byte_buffer>

#include <indexgen/core/types.hh>

namespace ixg {

    /// \brief Mini-language for functions of the element index.
    /// \details Expressions are trees of operations on 64-bit signed integers
    /// with the single variable "i". Textual form is a prefix notation,
    /// e.g. "(+ (* 3 i) 1)". Binary form is an operation code followed by
    /// the operands.
    namespace expressions {

        using value_type = sys::i64;

        class Expression {
        public:
            Expression() = default;
            virtual ~Expression() = default;
            Expression(const Expression&) = delete;
            Expression& operator=(const Expression&) = delete;
            Expression(Expression&&) = delete;
            Expression& operator=(Expression&&) = delete;
            virtual value_type evaluate(index_type i) const = 0;
            virtual void write(sys::byte_buffer& out) const = 0;
            /// Reads operands, \p depth is the nesting level that is still allowed.
            virtual void read(sys::byte_buffer& in, int depth) = 0;
            virtual void write(std::ostream& out) const = 0;
        };

        inline std::ostream& operator<<(std::ostream& out, const Expression& rhs) {
            rhs.write(out); return out;
        }

        class Index: public Expression {
        public:
            value_type evaluate(index_type i) const override;
            void write(sys::byte_buffer& out) const override;
            void read(sys::byte_buffer& in, int depth) override;
            void write(std::ostream& out) const override;
            Index() = default;
            ~Index() = default;
            Index(const Index&) = delete;
            Index& operator=(const Index&) = delete;
            Index(Index&&) = delete;
            Index& operator=(Index&&) = delete;
        };

        class Constant: public Expression {
        private:
            value_type _value{};
        public:
            inline explicit Constant(value_type value) noexcept: _value(value) {}
            value_type evaluate(index_type i) const override;
            void write(sys::byte_buffer& out) const override;
            void read(sys::byte_buffer& in, int depth) override;
            void write(std::ostream& out) const override;
            Constant() = default;
            ~Constant() = default;
            Constant(const Constant&) = delete;
            Constant& operator=(const Constant&) = delete;
            Constant(Constant&&) = delete;
            Constant& operator=(Constant&&) = delete;
        };

        class Negate: public Expression {
        private:
            expression_ptr _arg;
        public:
            inline explicit Negate(expression_ptr&& arg) noexcept: _arg(std::move(arg)) {}
            value_type evaluate(index_type i) const override;
            void write(sys::byte_buffer& out) const override;
            void read(sys::byte_buffer& in, int depth) override;
            void write(std::ostream& out) const override;
            Negate() = default;
            ~Negate() = default;
            Negate(const Negate&) = delete;
            Negate& operator=(const Negate&) = delete;
            Negate(Negate&&) = delete;
            Negate& operator=(Negate&&) = delete;
        };

        #define IXG_EXPRESSIONS_BINARY_OPERATION(NAME) \
            class NAME: public Expression { \
            private: \
                expression_ptr _a, _b; \
            public: \
                inline explicit NAME(expression_ptr&& a, expression_ptr&& b) noexcept: \
                _a(std::move(a)), _b(std::move(b)) {} \
                value_type evaluate(index_type i) const override; \
                void write(sys::byte_buffer& out) const override; \
                void read(sys::byte_buffer& in, int depth) override; \
                void write(std::ostream& out) const override; \
                NAME() = default; \
                ~NAME() = default; \
                NAME(const NAME&) = delete; \
                NAME& operator=(const NAME&) = delete; \
                NAME(NAME&&) = delete; \
                NAME& operator=(NAME&&) = delete; \
            };

        IXG_EXPRESSIONS_BINARY_OPERATION(Add);
        IXG_EXPRESSIONS_BINARY_OPERATION(Subtract);
        IXG_EXPRESSIONS_BINARY_OPERATION(Multiply);
        IXG_EXPRESSIONS_BINARY_OPERATION(Quotient);
        IXG_EXPRESSIONS_BINARY_OPERATION(Remainder);
        IXG_EXPRESSIONS_BINARY_OPERATION(Minimum);
        IXG_EXPRESSIONS_BINARY_OPERATION(Maximum);

        #undef IXG_EXPRESSIONS_BINARY_OPERATION

        enum class Expressions: sys::u8 {
            Index=1,
            Constant=2,
            Negate=3,
            Add=4,
            Subtract=5,
            Multiply=6,
            Quotient=7,
            Remainder=8,
            Minimum=9,
            Maximum=10,
        };

        expression_ptr make_expression(Expressions type);

        /// \throw std::invalid_argument on unknown operation code or when nesting
        /// is deeper than \p max_depth
        expression_ptr read(sys::byte_buffer& in, int max_depth);

        /// \throw std::invalid_argument on syntax error or when nesting
        /// is deeper than \p max_depth
        expression_ptr read(const char* first, const char* last, int max_depth);
        expression_ptr read(std::istream& in, int max_depth);

        inline expression_ptr read(const char* s, int max_depth) {
            using t = std::char_traits<char>;
            return read(s, s+t::length(s), max_depth);
        }

        inline expression_ptr read(const std::string& s, int max_depth) {
            return read(s.data(), s.data()+s.size(), max_depth);
        }

        inline expression_ptr index() { return expression_ptr(new Index); }

        inline expression_ptr constant(value_type value) {
            return expression_ptr(new Constant(value));
        }

        inline expression_ptr operator-(expression_ptr&& a) {
            return expression_ptr(new Negate(std::move(a)));
        }

        #define IXG_EXPRESSIONS_BINARY_OPERATOR(OP, NAME) \
            inline expression_ptr \
            operator OP(expression_ptr&& a, expression_ptr&& b) { \
                return expression_ptr(new NAME(std::move(a), std::move(b))); \
            } \
            inline expression_ptr \
            operator OP(expression_ptr&& a, value_type b) { \
                return expression_ptr(new NAME(std::move(a), constant(b))); \
            } \
            inline expression_ptr \
            operator OP(value_type a, expression_ptr&& b) { \
                return expression_ptr(new NAME(constant(a), std::move(b))); \
            }

        IXG_EXPRESSIONS_BINARY_OPERATOR(+, Add);
        IXG_EXPRESSIONS_BINARY_OPERATOR(-, Subtract);
        IXG_EXPRESSIONS_BINARY_OPERATOR(*, Multiply);
        IXG_EXPRESSIONS_BINARY_OPERATOR(/, Quotient);
        IXG_EXPRESSIONS_BINARY_OPERATOR(%, Remainder);

        #undef IXG_EXPRESSIONS_BINARY_OPERATOR

        inline expression_ptr min(expression_ptr&& a, expression_ptr&& b) {
            return expression_ptr(new Minimum(std::move(a), std::move(b)));
        }

        inline expression_ptr max(expression_ptr&& a, expression_ptr&& b) {
            return expression_ptr(new Maximum(std::move(a), std::move(b)));
        }

    }

}

#endif // vim:filetype=cpp
