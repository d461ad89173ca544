#ifndef INDEXGEN_CORE_FUNCTION_HH
#define INDEXGEN_CORE_FUNCTION_HH

#include <iosfwd>

#include <indexgen/core/types.hh>

namespace ixg {

    /// \brief Serializable computation that is shipped to workers.
    /// \details Captured parameters are the object's fields. The object is
    /// reconstructed on the worker by the type registry from its type id,
    /// then \link read \endlink restores the fields.
    class function_base {

    public:
        using type_id_type = sys::u16;

    private:
        type_id_type _type_id = 0;

    public:
        function_base() = default;
        virtual ~function_base() = default;
        function_base(const function_base&) = default;
        function_base& operator=(const function_base&) = default;
        function_base(function_base&&) = default;
        function_base& operator=(function_base&&) = default;

        virtual void write(function_buffer& out) const;
        virtual void read(function_buffer& in);
        virtual void write(std::ostream& out) const;

        /// Type id that was read from the wire, zero for locally created objects.
        inline type_id_type type_id() const noexcept { return this->_type_id; }
        inline void type_id(type_id_type rhs) noexcept { this->_type_id = rhs; }

    };

    std::ostream& operator<<(std::ostream& out, const function_base& rhs);

    /// Pure function from index to a value of type \p T.
    template <class T>
    class function: public function_base {

    public:
        using value_type = T;

    public:
        virtual value_type operator()(index_type i) const = 0;

    };

}

#endif // vim:filetype=cpp
