#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <indexgen/core/properties.hh>

namespace {

    enum class line_kind { blank, pair, malformed };

    inline bool is_line_end(char ch) noexcept { return ch == '\n' || ch == '\r'; }

    inline std::string trim(const std::string& s, std::string::size_type first,
                            std::string::size_type last) {
        while (first != last && std::isspace(static_cast<unsigned char>(s[first]))) { ++first; }
        while (first != last && std::isspace(static_cast<unsigned char>(s[last-1]))) { --last; }
        return s.substr(first, last-first);
    }

    line_kind parse(const std::string& line, std::string& key, std::string& value) {
        auto last = line.find('#');
        if (last == std::string::npos) { last = line.size(); }
        auto eq = line.find('=');
        if (eq == std::string::npos || eq > last) {
            key = trim(line, 0, last);
            value.clear();
            return key.empty() ? line_kind::blank : line_kind::malformed;
        }
        key = trim(line, 0, eq);
        value = trim(line, eq+1, last);
        return line_kind::pair;
    }

    template <class Location> void
    store(ixg::properties& props, const std::string& key, const std::string& value,
          const Location& location) {
        try {
            props.property(key, value);
        } catch (const std::exception& err) {
            std::stringstream msg;
            msg << location << ": invalid \"" << key << "\": " << err.what();
            throw std::runtime_error(msg.str());
        }
    }

}

void ixg::properties::open(const char* filename) {
    std::ifstream in(filename);
    if (!in.is_open()) {
        throw std::runtime_error(std::string("failed to open \"") + filename + '\"');
    }
    read(in, filename);
}

void ixg::properties::read(std::istream& in, const char* filename) {
    std::string line, key, value;
    int line_number = 0;
    char ch = 0;
    while (in) {
        line.clear();
        while (in.get(ch) && !is_line_end(ch)) { line += ch; }
        // "\r\n" and "\n\r" end one line
        if (in && is_line_end(in.peek()) && in.peek() != ch) { in.get(); }
        if (in.bad()) {
            throw std::runtime_error(std::string(filename) + ": read error");
        }
        if (line.empty() && !in) { break; }
        ++line_number;
        std::stringstream location;
        location << filename << ':' << line_number;
        switch (parse(line, key, value)) {
            case line_kind::blank: break;
            case line_kind::pair: store(*this, key, value, location.str()); break;
            case line_kind::malformed:
                throw std::runtime_error(location.str() + ": invalid line \"" + line + '\"');
        }
    }
}

void ixg::properties::read(int argc, const char** argv) {
    std::string key, value;
    for (int i=0; i<argc; ++i) {
        std::stringstream words(argv[i]);
        std::string word;
        const std::string location = "argument " + std::to_string(i);
        while (words >> word) {
            switch (parse(word, key, value)) {
                case line_kind::blank: break;
                case line_kind::pair: store(*this, key, value, location); break;
                case line_kind::malformed:
                    throw std::runtime_error(location + ": invalid property \"" + word + '\"');
            }
        }
    }
}
