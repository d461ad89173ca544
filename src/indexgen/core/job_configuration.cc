#include <algorithm>
#include <cstdlib>
#include <ostream>
#include <vector>

#include <indexgen/core/job_configuration.hh>

void ixg::job_configuration::property(const std::string& key, const std::string& value) {
    if (key.empty()) { throw std::invalid_argument("empty key"); }
    set(key, value);
}

const std::string& ixg::job_configuration::get(const std::string& key) const {
    auto result = this->_values.find(key);
    if (result == this->_values.end()) {
        throw std::out_of_range("no property \"" + key + '\"');
    }
    return result->second;
}

void ixg::job_configuration::read_environment() {
    if (const char* filename = std::getenv("IXG_CONFIG")) { open(filename); }
}

std::ostream& ixg::operator<<(std::ostream& out, const job_configuration& rhs) {
    std::vector<const job_configuration::value_type*> all;
    all.reserve(rhs.size());
    for (const auto& pair : rhs) { all.emplace_back(&pair); }
    std::sort(all.begin(), all.end(),
              [] (const job_configuration::value_type* a,
                  const job_configuration::value_type* b) {
                  return a->first < b->first;
              });
    for (const auto* pair : all) { out << pair->first << '=' << pair->second << '\n'; }
    return out;
}
