#ifndef INDEXGEN_CORE_PARTITION_HH
#define INDEXGEN_CORE_PARTITION_HH

#include <iosfwd>
#include <vector>

#include <indexgen/core/types.hh>

namespace ixg {

    /// Half-open range of indices [start,start+length).
    class partition {

    private:
        index_type _start = 0;
        index_type _length = 0;

    public:
        partition() = default;

        inline explicit partition(index_type start, index_type length) noexcept:
        _start(start), _length(length) {}

        inline index_type start() const noexcept { return this->_start; }
        inline index_type length() const noexcept { return this->_length; }
        inline index_type end() const noexcept { return this->_start + this->_length; }
        inline bool empty() const noexcept { return this->_length == 0; }

        inline bool operator==(const partition& rhs) const noexcept {
            return this->_start == rhs._start && this->_length == rhs._length;
        }

        inline bool operator!=(const partition& rhs) const noexcept {
            return !this->operator==(rhs);
        }

    };

    std::ostream& operator<<(std::ostream& out, const partition& rhs);

    /// \brief Size of all partitions except the last one.
    /// \details Never zero when \p n is positive.
    index_type split_size(index_type n, index_type parallelism_hint) noexcept;

    /// \brief Divides [0,n) into contiguous partitions of equal size.
    /// \details The remainder of the division is appended to the last partition.
    /// Partitions are ordered by start index. Zero partitions are
    /// returned for empty range. Zero hint is treated as one.
    partition_array make_partitions(index_type n, index_type parallelism_hint);

}

#endif // vim:filetype=cpp
