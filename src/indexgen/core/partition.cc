#include <ostream>

#include <indexgen/bits/contracts.hh>
#include <indexgen/core/partition.hh>

std::ostream& ixg::operator<<(std::ostream& out, const partition& rhs) {
    return out << '(' << rhs.start() << ',' << rhs.length() << ')';
}

auto ixg::split_size(index_type n, index_type parallelism_hint) noexcept -> index_type {
    if (parallelism_hint == 0) { parallelism_hint = 1; }
    index_type size = n / parallelism_hint;
    if (size == 0) { size = 1; }
    return size;
}

auto ixg::make_partitions(index_type n, index_type parallelism_hint) -> partition_array {
    partition_array result;
    if (n == 0) { return result; }
    const auto size = split_size(n, parallelism_hint);
    const index_type count = n / size;
    result.reserve(count);
    for (index_type i=0; i+1<count; ++i) { result.emplace_back(i*size, size); }
    const index_type last_start = (count-1)*size;
    result.emplace_back(last_start, n - last_start);
    Ensures(result.back().end() == n);
    return result;
}
