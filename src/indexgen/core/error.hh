#ifndef INDEXGEN_CORE_ERROR_HH
#define INDEXGEN_CORE_ERROR_HH

#include <unistdx/system/error>

#include <iosfwd>
#include <sstream>
#include <string>

namespace ixg {

    class error: public sys::error {

    public:
        template <class ... Arguments> inline
        error(const char* what, Arguments ... args):
        sys::error(make_message(what, args...).data()) {}

    private:

        static inline void print(std::ostream&) {}

        template <class Head, class ... Tail>
        static void print(std::ostream& out, const Head& head, const Tail& ... tail) {
            out << head;
            print(out, tail...);
        }

        template <class ... Args>
        static std::string make_message(const char* what, const Args& ... args) {
            std::stringstream tmp;
            tmp << what;
            print(tmp, args...);
            return tmp.str();
        }

    };

    /// Split bytes are truncated or can not be decoded.
    class corrupt_descriptor: public error {
    public:
        using error::error;
    };

    /// No object was pushed to the distributed cache under the key.
    class key_not_found: public error {

    private:
        std::string _key;

    public:
        inline explicit key_not_found(const std::string& key):
        error("key not found: ", key), _key(key) {}

        inline const std::string& key() const noexcept { return this->_key; }

    };

    class no_current_value: public error {
    public:
        inline no_current_value(): error("no current value") {}
    };

    inline void throw_error(const char* what) { throw error(what); }

    template <class ... Arguments>
    inline void throw_error(const char* what, Arguments ... args) {
        throw error(what, args...);
    }

    std::ostream& operator<<(std::ostream& out, const error& rhs);

}

#endif // vim:filetype=cpp
