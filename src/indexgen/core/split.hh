#ifndef INDEXGEN_CORE_SPLIT_HH
#define INDEXGEN_CORE_SPLIT_HH

#include <iosfwd>
#include <string>
#include <vector>

#include <indexgen/core/function.hh>
#include <indexgen/core/partition.hh>
#include <indexgen/core/types.hh>

namespace ixg {

    /// \brief Unit of work for one worker: partition and the function.
    /// \details Splits created by one planning call share the same function
    /// object. Each split writes its own copy of the function, and each decoded
    /// split owns a separate function object.
    ///
    /// Wire format (integers in buffer byte order):
    /// \code
    /// [start:4][length:4][payload-size:4][payload]
    /// payload = [function-type-id:2][function fields]
    /// \endcode
    class split {

    public:
        using location_array = std::vector<std::string>;

    private:
        index_type _start = 0;
        index_type _length = 0;
        shared_function_ptr _function;

    public:
        split() = default;
        ~split() = default;
        split(const split&) = default;
        split& operator=(const split&) = default;
        split(split&&) = default;
        split& operator=(split&&) = default;

        inline explicit
        split(index_type start, index_type length, shared_function_ptr f) noexcept:
        _start(start), _length(length), _function(std::move(f)) {}

        inline explicit split(const ixg::partition& p, shared_function_ptr f) noexcept:
        split(p.start(), p.length(), std::move(f)) {}

        inline index_type start() const noexcept { return this->_start; }
        inline index_type length() const noexcept { return this->_length; }
        inline index_type end() const noexcept { return this->_start + this->_length; }
        inline ixg::partition partition() const noexcept { return ixg::partition(start(), length()); }
        inline const shared_function_ptr& function() const noexcept { return this->_function; }

        /// Values are computed, not stored, so any node is equally good.
        inline location_array locations() const { return location_array(); }

        void write(function_buffer& out) const;

        /// \throw corrupt_descriptor when the bytes are truncated or the function
        /// can not be reconstructed
        void read(function_buffer& in);

        std::string encode(function_type_registry& types) const;
        static split decode(const std::string& bytes, function_type_registry& types);

    };

    std::ostream& operator<<(std::ostream& out, const split& rhs);

}

#endif // vim:filetype=cpp
