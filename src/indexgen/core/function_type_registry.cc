#include <ostream>
#include <stdexcept>

#include <indexgen/core/error.hh>
#include <indexgen/core/function_type_registry.hh>

auto ixg::function_type_registry::find(id_type id) const -> const function_type* {
    lock_type lock(this->_mutex);
    auto result = this->_types.find(id);
    return result == this->_types.end() ? nullptr : &result->second;
}

auto ixg::function_type_registry::find(std::type_index idx) const -> const function_type* {
    lock_type lock(this->_mutex);
    auto result = this->_ids.find(idx);
    if (result == this->_ids.end()) { return nullptr; }
    return &this->_types.at(result->second);
}

void ixg::function_type_registry::add(const function_type& type) {
    if (type.id() == 0) { throw std::invalid_argument("zero function type id"); }
    lock_type lock(this->_mutex);
    auto existing = this->_ids.find(type.index());
    if (existing != this->_ids.end()) {
        throw_error("function type ", type.name(), " is already registered with id ",
                    existing->second);
    }
    if (this->_types.count(type.id()) != 0) {
        throw_error("function type id ", type.id(), " is already taken by ",
                    this->_types.at(type.id()).name());
    }
    this->_types.emplace(type.id(), type);
    this->_ids.emplace(type.index(), type.id());
}

auto ixg::function_type_registry::size() const -> type_table::size_type {
    lock_type lock(this->_mutex);
    return this->_types.size();
}

std::ostream& ixg::operator<<(std::ostream& out, const function_type& rhs) {
    return out << rhs.id() << '=' << rhs.name();
}

std::ostream& ixg::operator<<(std::ostream& out, const function_type_registry& rhs) {
    function_type_registry::lock_type lock(rhs._mutex);
    bool first = true;
    for (const auto& pair : rhs._types) {
        if (!first) { out << ' '; }
        out << pair.second;
        first = false;
    }
    return out;
}
