#ifndef INDEXGEN_API_HH
#define INDEXGEN_API_HH

#include <memory>
#include <string>
#include <vector>

#include <indexgen/core/error.hh>
#include <indexgen/core/expression_function.hh>
#include <indexgen/core/function_buffer.hh>
#include <indexgen/core/function_source.hh>
#include <indexgen/core/job_context.hh>
#include <indexgen/core/local_runner.hh>

namespace ixg {

    /// \brief Creates a source of \p n elements defined by textual index expression.
    /// \throw std::invalid_argument on syntax error
    inline function_source<expressions::value_type>
    from_expression(job_context& context, job_configuration& conf,
                    index_type n, const std::string& text) {
        using value_type = expressions::value_type;
        std::shared_ptr<const function<value_type>> f(new expression_function(text));
        return make_function_source<value_type>(context, conf, n, std::move(f));
    }

    /// Evaluates the whole source on local threads.
    template <class T> inline std::vector<T>
    collect(job_context& context, const partitioned_source<T>& source,
            const job_configuration& conf) {
        local_runner runner(context);
        return runner.collect(source, conf);
    }

}

#endif // vim:filetype=cpp
