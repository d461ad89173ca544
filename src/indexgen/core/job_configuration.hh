#ifndef INDEXGEN_CORE_JOB_CONFIGURATION_HH
#define INDEXGEN_CORE_JOB_CONFIGURATION_HH

#include <iosfwd>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>

#include <indexgen/core/properties.hh>

namespace ixg {

    /// \brief Job-scoped configuration shared by submission, planning and workers.
    class job_configuration: public properties {

    private:
        using value_table = std::unordered_map<std::string,std::string>;

    public:
        using const_iterator = value_table::const_iterator;
        using value_type = value_table::value_type;
        using size_type = value_table::size_type;

    private:
        value_table _values;

    public:

        job_configuration() = default;
        ~job_configuration() = default;
        job_configuration(const job_configuration&) = default;
        job_configuration& operator=(const job_configuration&) = default;
        job_configuration(job_configuration&&) = default;
        job_configuration& operator=(job_configuration&&) = default;

        inline explicit job_configuration(const char* filename) { open(filename); }

        void property(const std::string& key, const std::string& value) override;

        inline void set(const std::string& key, const std::string& value) {
            this->_values[key] = value;
        }

        template <class T> inline void
        set(const std::string& key, const T& value) {
            std::stringstream tmp;
            tmp << value;
            this->_values[key] = tmp.str();
        }

        /// \throw std::out_of_range if there is no such key
        const std::string& get(const std::string& key) const;

        template <class T> inline T
        get(const std::string& key, T default_value) const {
            auto result = this->_values.find(key);
            if (result == this->_values.end()) { return default_value; }
            return parse<T>(key, result->second);
        }

        inline bool contains(const std::string& key) const {
            return this->_values.find(key) != this->_values.end();
        }

        inline void unset(const std::string& key) { this->_values.erase(key); }
        inline const_iterator begin() const noexcept { return this->_values.begin(); }
        inline const_iterator end() const noexcept { return this->_values.end(); }
        inline size_type size() const noexcept { return this->_values.size(); }
        inline bool empty() const noexcept { return this->_values.empty(); }

        /// Reads the file named by IXG_CONFIG environment variable, if any.
        void read_environment();

    private:

        template <class T> static T
        parse(const std::string& key, const std::string& s) {
            T value{};
            std::istringstream in(s);
            if (std::is_unsigned<T>::value && s.find('-') != std::string::npos) {
                in.setstate(std::ios::failbit);
            } else {
                in >> value;
            }
            if (!in || !(in >> std::ws).eof()) {
                std::stringstream msg;
                msg << "bad value \"" << s << "\" of \"" << key << '\"';
                throw std::invalid_argument(msg.str());
            }
            return value;
        }

    };

    std::ostream& operator<<(std::ostream& out, const job_configuration& rhs);

}

#endif // vim:filetype=cpp
