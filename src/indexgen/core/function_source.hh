#ifndef INDEXGEN_CORE_FUNCTION_SOURCE_HH
#define INDEXGEN_CORE_FUNCTION_SOURCE_HH

#include <memory>
#include <stdexcept>

#include <indexgen/core/distributed_cache.hh>
#include <indexgen/core/function.hh>
#include <indexgen/core/function_input_format.hh>
#include <indexgen/core/job_configuration.hh>
#include <indexgen/core/job_context.hh>
#include <indexgen/core/partitioned_source.hh>

namespace ixg {

    /// \brief Virtual collection of \p n elements produced by a function of
    /// element index.
    /// \details The source receives its instance id on construction.
    /// The function type must be registered in the context type registry
    /// on both submission and worker side.
    template <class T>
    class function_source: public partitioned_source<T> {

    public:
        using value_type = T;
        using function_type = ixg::function<T>;
        using function_pointer = std::shared_ptr<const function_type>;
        using iterator = typename partitioned_source<T>::iterator;

    private:
        job_context& _context;
        instance_id_type _id;
        index_type _size;
        function_pointer _function;

    public:

        inline explicit
        function_source(job_context& context, index_type n, function_pointer f):
        _context(context), _id(context.ids().next()), _size(n), _function(std::move(f)) {
            if (!this->_function) { throw std::invalid_argument("null function"); }
        }

        inline instance_id_type id() const noexcept { return this->_id; }
        inline index_type size() const noexcept { return this->_size; }
        inline const function_pointer& function() const noexcept { return this->_function; }

        void check() const override {}
        sys::u64 input_size() const override { return this->_size; }

        /// Publishes element count and id, pushes the function to the cache.
        void configure(job_configuration& conf) const override {
            conf.set(length_property, this->_size);
            conf.set(id_property, this->_id);
            push_function(this->_context.cache(), function_property(this->_id),
                          *this->_function, this->_context.types());
        }

        split_array partitions(const job_configuration& conf) const override {
            function_input_format format;
            return format.splits(conf, this->_context.cache(), this->_context.types());
        }

        iterator iterate(const split& s) const override { return iterator(s); }

    };

    /// \brief Creates function source and publishes it in \p conf.
    template <class T> inline function_source<T>
    make_function_source(job_context& context, job_configuration& conf,
                         index_type n, std::shared_ptr<const ixg::function<T>> f) {
        function_source<T> source(context, n, std::move(f));
        source.check();
        source.configure(conf);
        return source;
    }

}

#endif // vim:filetype=cpp
