#ifndef INDEXGEN_CORE_PROPERTIES_HH
#define INDEXGEN_CORE_PROPERTIES_HH

#include <iosfwd>
#include <string>

namespace ixg {

    /// \brief Parses job settings written as "key=value" pairs.
    /// \details Files contain one pair per line, "#" starts a comment that
    /// lasts until the end of the line, blank lines are skipped and both LF
    /// and CR characters end a line. Command line arguments may contain several
    /// pairs separated by spaces. Keys and values are trimmed, each pair is
    /// passed to \link property \endlink.
    class properties {

    public:

        properties() = default;
        virtual ~properties() = default;
        properties(const properties&) = default;
        properties& operator=(const properties&) = default;
        properties(properties&&) = default;
        properties& operator=(properties&&) = default;

        /// \throw std::runtime_error when the file can not be opened or parsed
        void open(const char* filename);
        inline void open(const std::string& filename) { open(filename.data()); }

        /// \throw std::runtime_error with "filename:line:" prefix
        void read(std::istream& in, const char* filename);

        /// \throw std::runtime_error with "argument N:" prefix
        void read(int argc, const char** argv);
        inline void read(int argc, char** argv) { read(argc, const_cast<const char**>(argv)); }

        /// Stores one pair. Exceptions are reported with the location of the pair.
        virtual void property(const std::string& key, const std::string& value) = 0;

    };

}

#endif // vim:filetype=cpp
