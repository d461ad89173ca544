#ifndef INDEXGEN_CORE_FUNCTION_TYPE_REGISTRY_HH
#define INDEXGEN_CORE_FUNCTION_TYPE_REGISTRY_HH

#include <iosfwd>
#include <map>
#include <mutex>
#include <typeindex>
#include <unordered_map>

#include <indexgen/core/function.hh>
#include <indexgen/core/function_type.hh>

namespace ixg {

    /// \brief Maps portable type ids to function constructors.
    /// \details Submission and worker sides must register the same types
    /// under the same ids. Types are never removed, so pointers returned by
    /// \link find \endlink stay valid for the lifetime of the registry.
    /// All methods are thread-safe.
    class function_type_registry {

    public:
        using id_type = function_type::id_type;

    private:
        using type_table = std::map<id_type,function_type>;
        using index_table = std::unordered_map<std::type_index,id_type>;
        using mutex_type = std::mutex;
        using lock_type = std::lock_guard<mutex_type>;

    private:
        type_table _types;
        index_table _ids;
        mutable mutex_type _mutex;

    public:
        function_type_registry() = default;
        ~function_type_registry() = default;
        function_type_registry(const function_type_registry&) = delete;
        function_type_registry& operator=(const function_type_registry&) = delete;
        function_type_registry(function_type_registry&&) = delete;
        function_type_registry& operator=(function_type_registry&&) = delete;

        /// \return null pointer if the id is not registered
        const function_type* find(id_type id) const;

        /// \return null pointer if the type is not registered
        const function_type* find(std::type_index idx) const;

        /// \throw std::invalid_argument if the id is zero
        /// \throw error if the id or the type is already registered
        void add(const function_type& type);

        template <class Type> inline void
        add(id_type id) { this->add(function_type::make<Type>(id)); }

        type_table::size_type size() const;

        inline bool empty() const { return size() == 0; }

        friend std::ostream&
        operator<<(std::ostream& out, const function_type_registry& rhs);

    };

    std::ostream& operator<<(std::ostream& out, const function_type_registry& rhs);

}

#endif // vim:filetype=cpp
