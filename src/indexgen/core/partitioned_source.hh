#ifndef INDEXGEN_CORE_PARTITIONED_SOURCE_HH
#define INDEXGEN_CORE_PARTITIONED_SOURCE_HH

#include <indexgen/core/range_iterator.hh>
#include <indexgen/core/split.hh>
#include <indexgen/core/types.hh>

namespace ixg {

    /// \brief Data source that a batch host splits between its workers.
    /// \details The host calls \link check \endlink and \link configure \endlink
    /// at submission time, \link partitions \endlink at planning time and
    /// \link iterate \endlink on each worker.
    template <class T>
    class partitioned_source {

    public:
        using value_type = T;
        using iterator = range_iterator<T>;

    public:
        partitioned_source() = default;
        virtual ~partitioned_source() = default;
        partitioned_source(const partitioned_source&) = default;
        partitioned_source& operator=(const partitioned_source&) = default;
        partitioned_source(partitioned_source&&) = default;
        partitioned_source& operator=(partitioned_source&&) = default;

        virtual void check() const = 0;

        /// Number of elements.
        virtual sys::u64 input_size() const = 0;

        virtual void configure(job_configuration& conf) const = 0;
        virtual split_array partitions(const job_configuration& conf) const = 0;
        virtual iterator iterate(const split& s) const = 0;

    };

}

#endif // vim:filetype=cpp
