#include <stdexcept>

#include <indexgen/core/expression_function.hh>
#include <indexgen/core/job_context.hh>

ixg::job_context::job_context(): job_context(cache_ptr(new memory_cache)) {}

ixg::job_context::job_context(cache_ptr&& cache): _cache(std::move(cache)) {
    if (!this->_cache) { throw std::invalid_argument("null cache"); }
    add_builtin_types(this->_types);
    this->_configuration.read_environment();
}
