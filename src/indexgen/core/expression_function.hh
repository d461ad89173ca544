#ifndef INDEXGEN_CORE_EXPRESSION_FUNCTION_HH
#define INDEXGEN_CORE_EXPRESSION_FUNCTION_HH

#include <string>

#include <indexgen/core/expressions.hh>
#include <indexgen/core/function.hh>

namespace ixg {

    /// \brief Function defined by an index expression.
    /// \details Does not need any user-defined type to be registered on
    /// workers: the expression tree is transferred as data.
    class expression_function: public function<expressions::value_type> {

    public:
        using expression_ptr = expressions::expression_ptr;
        static constexpr const int max_depth = 64;

    private:
        expression_ptr _expression;

    public:
        expression_function() = default;
        ~expression_function() = default;
        expression_function(const expression_function&) = delete;
        expression_function& operator=(const expression_function&) = delete;
        expression_function(expression_function&&) = default;
        expression_function& operator=(expression_function&&) = default;

        inline explicit expression_function(expression_ptr&& expr) noexcept:
        _expression(std::move(expr)) {}

        /// \throw std::invalid_argument on syntax error
        inline explicit expression_function(const std::string& text):
        _expression(expressions::read(text, max_depth)) {}

        value_type operator()(index_type i) const override;
        void write(function_buffer& out) const override;
        void read(function_buffer& in) override;
        void write(std::ostream& out) const override;

        inline const expressions::Expression* expression() const noexcept {
            return this->_expression.get();
        }

    };

    /// Type id of \link expression_function \endlink.
    constexpr const function_base::type_id_type expression_function_type_id = 1;

    /// Registers function types that are shipped with the library.
    void add_builtin_types(function_type_registry& types);

}

#endif // vim:filetype=cpp
