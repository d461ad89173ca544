#ifndef INDEXGEN_CORE_INSTANCE_ID_ALLOCATOR_HH
#define INDEXGEN_CORE_INSTANCE_ID_ALLOCATOR_HH

#include <atomic>

#include <indexgen/core/types.hh>

namespace ixg {

    /// \brief Hands out identifiers of function sources.
    /// \details Several function sources of the same job push their functions
    /// to the same distributed cache, and the identifier keeps their keys apart.
    /// One allocator is shared by all sources planned in the same context.
    /// Identifiers start from one, zero means "no identifier".
    class instance_id_allocator {

    public:
        using id_type = instance_id_type;

    private:
        std::atomic<id_type> _counter{0};

    public:
        instance_id_allocator() = default;
        ~instance_id_allocator() = default;
        instance_id_allocator(const instance_id_allocator&) = delete;
        instance_id_allocator& operator=(const instance_id_allocator&) = delete;
        instance_id_allocator(instance_id_allocator&&) = delete;
        instance_id_allocator& operator=(instance_id_allocator&&) = delete;

        inline id_type next() noexcept { return ++this->_counter; }

        /// The last identifier that was handed out.
        inline id_type last() const noexcept { return this->_counter.load(); }

    };

}

#endif // vim:filetype=cpp
