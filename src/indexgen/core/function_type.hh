#ifndef INDEXGEN_CORE_FUNCTION_TYPE_HH
#define INDEXGEN_CORE_FUNCTION_TYPE_HH

#include <iosfwd>
#include <typeindex>
#include <typeinfo>

#include <indexgen/core/function.hh>
#include <indexgen/core/types.hh>

namespace ixg {

    /// Registered function type: wire id, factory and C++ type.
    class function_type {

    public:
        using id_type = function_base::type_id_type;
        using constructor_type = function_base* (*)();

    private:
        id_type _id;
        constructor_type _construct;
        std::type_index _index;

    public:
        inline explicit
        function_type(id_type id, constructor_type ctr, std::type_index idx) noexcept:
        _id(id), _construct(ctr), _index(idx) {}

        template <class Type> static inline function_type make(id_type id) {
            return function_type(id, [] () -> function_base* { return new Type; },
                                 typeid(Type));
        }

        /// New object with default field values and the type id set.
        inline function_ptr construct() const {
            function_ptr result(this->_construct());
            result->type_id(this->_id);
            return result;
        }

        inline id_type id() const noexcept { return this->_id; }
        inline std::type_index index() const noexcept { return this->_index; }
        inline const char* name() const noexcept { return this->_index.name(); }

    };

    std::ostream& operator<<(std::ostream& out, const function_type& rhs);

}

#endif // vim:filetype=cpp
