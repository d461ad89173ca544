#ifndef INDEXGEN_CORE_JOB_CONTEXT_HH
#define INDEXGEN_CORE_JOB_CONTEXT_HH

#include <memory>

#include <indexgen/core/distributed_cache.hh>
#include <indexgen/core/function_type_registry.hh>
#include <indexgen/core/instance_id_allocator.hh>
#include <indexgen/core/job_configuration.hh>

namespace ixg {

    /// \brief Everything that function sources of one job share.
    /// \details Created once per job before any source, destroyed after the
    /// last split of the job was read. Built-in function types are registered
    /// on construction, and the file named by IXG_CONFIG environment variable
    /// is read into the configuration.
    class job_context {

    public:
        using cache_ptr = std::unique_ptr<distributed_cache>;

    private:
        job_configuration _configuration;
        function_type_registry _types;
        instance_id_allocator _ids;
        cache_ptr _cache;

    public:
        job_context();
        explicit job_context(cache_ptr&& cache);
        ~job_context() = default;
        job_context(const job_context&) = delete;
        job_context& operator=(const job_context&) = delete;
        job_context(job_context&&) = delete;
        job_context& operator=(job_context&&) = delete;

        inline job_configuration& configuration() noexcept { return this->_configuration; }
        inline const job_configuration& configuration() const noexcept { return this->_configuration; }
        inline function_type_registry& types() noexcept { return this->_types; }
        inline instance_id_allocator& ids() noexcept { return this->_ids; }
        inline distributed_cache& cache() noexcept { return *this->_cache; }
        inline const distributed_cache& cache() const noexcept { return *this->_cache; }

    };

}

#endif // vim:filetype=cpp
