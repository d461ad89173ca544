#ifndef INDEXGEN_CORE_TYPES_HH
#define INDEXGEN_CORE_TYPES_HH

#include <memory>
#include <vector>

#include <unistdx/base/types>

namespace ixg {

    class corrupt_descriptor;
    class distributed_cache;
    class error;
    class function_base;
    class function_buffer;
    class function_input_format;
    class function_type;
    class function_type_registry;
    class instance_id_allocator;
    class job_configuration;
    class key_not_found;
    class local_runner;
    class no_current_value;
    class partition;
    class split;
    template <class T> class function;
    template <class T> class function_source;
    template <class T> class partitioned_source;
    template <class T> class range_iterator;

    /// Position of an element in the virtual collection.
    using index_type = sys::u32;
    using instance_id_type = sys::u32;

    using function_ptr = std::unique_ptr<function_base>;
    using shared_function_ptr = std::shared_ptr<const function_base>;
    using partition_array = std::vector<partition>;
    using split_array = std::vector<split>;

    namespace expressions {
        class Expression;
        class Index;
        class Constant;
        class Negate;
        class Add;
        class Subtract;
        class Multiply;
        class Quotient;
        class Remainder;
        class Minimum;
        class Maximum;
        enum class Expressions: sys::u8;
        using expression_ptr = std::unique_ptr<Expression>;
    }

}

#endif // vim:filetype=cpp
