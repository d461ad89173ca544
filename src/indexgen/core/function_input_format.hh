#ifndef INDEXGEN_CORE_FUNCTION_INPUT_FORMAT_HH
#define INDEXGEN_CORE_FUNCTION_INPUT_FORMAT_HH

#include <string>

#include <indexgen/core/split.hh>
#include <indexgen/core/types.hh>

namespace ixg {

    /// Configuration key for the number of elements.
    constexpr const char* const length_property = "indexgen.function.n";
    /// Configuration key for the source instance id.
    constexpr const char* const id_property = "indexgen.function.id";
    /// Ambient configuration key for the desired number of splits.
    constexpr const char* const parallelism_property = "job.map-tasks";

    /// Distributed cache key of the function of the source \p id.
    std::string function_property(instance_id_type id);

    /// \brief Plans the splits of a function source.
    /// \details Reads the number of elements, the instance id and the
    /// parallelism hint from the configuration, pulls the function from the
    /// cache and creates one split for each partition. All splits share
    /// the pulled function object.
    class function_input_format {

    public:
        /// \throw key_not_found if the function was not pushed
        split_array splits(const job_configuration& conf,
                           const distributed_cache& cache,
                           function_type_registry& types) const;

    };

}

#endif // vim:filetype=cpp
