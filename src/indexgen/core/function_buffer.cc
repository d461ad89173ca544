#include <stdexcept>
#include <typeinfo>

#include <indexgen/bits/contracts.hh>
#include <indexgen/core/error.hh>
#include <indexgen/core/function.hh>
#include <indexgen/core/function_buffer.hh>
#include <indexgen/core/function_type_registry.hh>

void ixg::function_buffer::write(const std::string& rhs) {
    const payload_size_type n = rhs.size();
    this->write(n);
    this->write(rhs.data(), n);
}

void ixg::function_buffer::read(std::string& rhs) {
    payload_size_type n = 0;
    this->read(n);
    if (n > remaining()) { throw std::range_error("string size exceeds buffer"); }
    rhs.resize(n);
    this->read(&rhs[0], n);
}

void ixg::function_buffer::write(const function_base* f) {
    Expects(f);
    if (!types()) { throw_error("no function types"); }
    const auto* type = this->types()->find(typeid(*f));
    if (!type) { throw_error("no function type for ", typeid(*f).name()); }
    this->write(type->id());
    f->write(*this);
}

void ixg::function_buffer::read(function_ptr& f) {
    function_type::id_type id = 0;
    this->read(id);
    if (!types()) { throw_error("no function types"); }
    const auto* type = this->types()->find(id);
    if (!type) { throw corrupt_descriptor("no function type for id ", id); }
    f = type->construct();
    f->read(*this);
}

ixg::payload_write_guard::payload_write_guard(function_buffer& buffer):
_buffer(buffer), _old_position(buffer.position()) {
    this->_buffer.write(function_buffer::payload_size_type(0));
}

ixg::payload_write_guard::~payload_write_guard() {
    auto new_position = this->_buffer.position();
    const function_buffer::payload_size_type size =
        new_position - this->_old_position - sizeof(function_buffer::payload_size_type);
    this->_buffer.position(this->_old_position);
    this->_buffer.write(size);
    this->_buffer.position(new_position);
}

ixg::payload_read_guard::payload_read_guard(function_buffer& in):
_buffer(in), _old_limit(in.limit()) {
    if (in.remaining() < sizeof(function_buffer::payload_size_type)) { return; }
    in.read(this->_size);
    if (in.remaining() >= this->_size) {
        this->_good = true;
        in.limit(in.position() + this->_size);
    }
}

ixg::payload_read_guard::~payload_read_guard() {
    if (good()) {
        this->_buffer.position(this->_buffer.limit());
        this->_buffer.limit(this->_old_limit);
    }
}
