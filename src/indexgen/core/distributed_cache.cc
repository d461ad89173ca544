#include <fstream>
#include <sstream>
#include <stdexcept>

#include <unistdx/base/log_message>

#include <indexgen/core/distributed_cache.hh>
#include <indexgen/core/error.hh>
#include <indexgen/core/function.hh>
#include <indexgen/core/function_buffer.hh>

namespace {

    template <class ... Args> inline void
    log(const Args& ... args) {
        sys::log_message("cache", args...);
    }

    inline bool is_valid_key(const std::string& key) noexcept {
        if (key.empty() || key == "." || key == "..") { return false; }
        return key.find('/') == std::string::npos;
    }

}

void ixg::memory_cache::put(const std::string& key, const std::string& value) {
    lock_type lock(this->_mutex);
    this->_values[key] = value;
}

std::string ixg::memory_cache::get(const std::string& key) const {
    lock_type lock(this->_mutex);
    auto result = this->_values.find(key);
    if (result == this->_values.end()) { throw key_not_found(key); }
    return result->second;
}

std::string ixg::directory_cache::path(const std::string& key) const {
    if (!is_valid_key(key)) { throw std::invalid_argument("bad key \"" + key + '\"'); }
    std::string result;
    result.reserve(this->_directory.size() + key.size() + 1);
    result += this->_directory;
    result += '/';
    result += key;
    return result;
}

void ixg::directory_cache::put(const std::string& key, const std::string& value) {
    const auto filename = path(key);
    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) { throw_error("failed to open \"", filename, "\" for writing"); }
    out.write(value.data(), value.size());
    out.close();
    if (!out) { throw_error("failed to write \"", filename, '\"'); }
}

std::string ixg::directory_cache::get(const std::string& key) const {
    const auto filename = path(key);
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) { throw key_not_found(key); }
    std::stringstream tmp;
    tmp << in.rdbuf();
    if (in.bad()) { throw_error("failed to read \"", filename, '\"'); }
    return tmp.str();
}

void ixg::push_function(distributed_cache& cache, const std::string& key,
                        const function_base& f, function_type_registry& types) {
    function_buffer buf;
    buf.types(&types);
    buf.write(f);
    buf.flip();
    std::string value(reinterpret_cast<const char*>(buf.data()), buf.remaining());
    log("push _ bytes to _", value.size(), key);
    cache.put(key, value);
}

auto ixg::pull_function(const distributed_cache& cache, const std::string& key,
                        function_type_registry& types) -> function_ptr {
    const auto value = cache.get(key);
    log("pull _ bytes from _", value.size(), key);
    function_buffer buf;
    buf.types(&types);
    buf.write(value.data(), value.size());
    buf.flip();
    function_ptr f;
    try {
        buf.read(f);
    } catch (const std::range_error& err) {
        throw corrupt_descriptor("truncated function ", key, ": ", err.what());
    } catch (const std::invalid_argument& err) {
        throw corrupt_descriptor("bad function ", key, ": ", err.what());
    }
    if (buf.remaining() != 0) {
        throw corrupt_descriptor("function ", key, " has ", buf.remaining(), " unread bytes");
    }
    return f;
}
