#include <unistdx/base/log_message>

#include <indexgen/core/distributed_cache.hh>
#include <indexgen/core/function_input_format.hh>
#include <indexgen/core/job_configuration.hh>
#include <indexgen/core/partition.hh>

namespace {

    template <class ... Args> inline void
    log(const Args& ... args) {
        sys::log_message("function-input", args...);
    }

}

std::string ixg::function_property(instance_id_type id) {
    return std::string("indexgen.function.f") + std::to_string(id);
}

auto ixg::function_input_format::splits(const job_configuration& conf,
                                        const distributed_cache& cache,
                                        function_type_registry& types) const -> split_array {
    const auto n = conf.get<index_type>(length_property, 0);
    const auto id = conf.get<instance_id_type>(id_property, 0);
    shared_function_ptr f(pull_function(cache, function_property(id), types));
    const auto hint = conf.get<index_type>(parallelism_property, 1);
    log("id=_", id);
    log("n=_", n);
    log("num-splits-hint=_", hint);
    log("split-size=_", split_size(n, hint));
    split_array result;
    for (const auto& p : make_partitions(n, hint)) { result.emplace_back(p, f); }
    return result;
}
