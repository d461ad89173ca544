#ifndef INDEXGEN_CORE_FUNCTION_BUFFER_HH
#define INDEXGEN_CORE_FUNCTION_BUFFER_HH

#include <string>
#include <type_traits>

#include <unistdx/base/byte_buffer>

#include <indexgen/core/function_type_registry.hh>
#include <indexgen/core/types.hh>

namespace ixg {

    /// \brief Byte buffer that writes and reads polymorphic functions.
    /// \details Functions are written as their type id followed by their fields.
    class function_buffer: public sys::byte_buffer {

    public:
        using payload_size_type = sys::u32;

    private:
        function_type_registry* _types = nullptr;

    public:
        using sys::byte_buffer::byte_buffer;
        using sys::byte_buffer::read;
        using sys::byte_buffer::write;

        void write(const std::string& rhs);
        void read(std::string& rhs);
        void write(const function_base* f);
        inline void write(const function_base& f) { this->write(&f); }
        void read(function_ptr& f);

        template <class T> inline function_buffer&
        operator>>(T& rhs) { this->read(rhs); return *this; }

        inline void types(function_type_registry* rhs) noexcept { this->_types = rhs; }
        inline const function_type_registry* types() const noexcept { return this->_types; }
        inline function_type_registry* types() noexcept { return this->_types; }

    };

    template <class T> inline auto
    operator<<(function_buffer& out, const T& rhs)
    -> typename std::enable_if<!std::is_pointer<T>::value,function_buffer&>::type
    { out.write(rhs); return out; }

    /// \brief Prefixes everything written in its lifetime with the size in bytes.
    class payload_write_guard {

    private:
        function_buffer& _buffer;
        sys::byte_buffer::size_type _old_position = 0;

    public:
        explicit payload_write_guard(function_buffer& buffer);
        ~payload_write_guard();

    };

    /// \brief Limits the buffer to the size-prefixed payload at the current position.
    /// \details The guard is not good when the buffer holds less than the
    /// prefix says. Previous limit is restored on destruction.
    class payload_read_guard {

    private:
        function_buffer& _buffer;
        sys::byte_buffer::size_type _old_limit = 0;
        function_buffer::payload_size_type _size = 0;
        bool _good = false;

    public:
        explicit payload_read_guard(function_buffer& buffer);
        ~payload_read_guard();
        inline function_buffer::payload_size_type size() const noexcept { return this->_size; }
        inline bool good() const noexcept { return this->_good; }
        inline explicit operator bool() const noexcept { return good(); }
        inline bool operator!() const noexcept { return !good(); }

    };

}

#endif // vim:filetype=cpp
