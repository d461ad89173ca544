#include <ostream>
#include <stdexcept>

#include <indexgen/core/error.hh>
#include <indexgen/core/function_buffer.hh>
#include <indexgen/core/split.hh>

void ixg::split::write(function_buffer& out) const {
    if (!this->_function) { throw_error("split has no function"); }
    out << this->_start << this->_length;
    payload_write_guard g(out);
    out.write(this->_function.get());
}

void ixg::split::read(function_buffer& in) {
    index_type start = 0, length = 0;
    function_ptr f;
    try {
        in >> start >> length;
        payload_read_guard g(in);
        if (!g) { throw corrupt_descriptor("truncated function payload"); }
        in.read(f);
        if (in.remaining() != 0) {
            throw corrupt_descriptor("function payload has ", in.remaining(),
                                     " unread bytes");
        }
    } catch (const std::range_error& err) {
        throw corrupt_descriptor("truncated split: ", err.what());
    } catch (const std::invalid_argument& err) {
        throw corrupt_descriptor("bad function payload: ", err.what());
    }
    if (start + length < start) { throw corrupt_descriptor("bad range ", start, '+', length); }
    this->_start = start;
    this->_length = length;
    this->_function = std::move(f);
}

std::string ixg::split::encode(function_type_registry& types) const {
    function_buffer buf;
    buf.types(&types);
    write(buf);
    buf.flip();
    return std::string(reinterpret_cast<const char*>(buf.data()), buf.remaining());
}

auto ixg::split::decode(const std::string& bytes, function_type_registry& types) -> split {
    function_buffer buf;
    buf.types(&types);
    buf.write(bytes.data(), bytes.size());
    buf.flip();
    split result;
    result.read(buf);
    return result;
}

std::ostream& ixg::operator<<(std::ostream& out, const split& rhs) {
    out << rhs.partition();
    if (rhs.function()) { out << ' ' << *rhs.function(); }
    return out;
}
