#ifndef INDEXGEN_CORE_DISTRIBUTED_CACHE_HH
#define INDEXGEN_CORE_DISTRIBUTED_CACHE_HH

#include <mutex>
#include <string>
#include <unordered_map>

#include <indexgen/core/types.hh>

namespace ixg {

    /// \brief Store that publishes a value once and serves it to every worker.
    /// \details All puts happen before the job starts, so that every get
    /// during the job sees them.
    class distributed_cache {

    public:
        distributed_cache() = default;
        virtual ~distributed_cache() = default;
        distributed_cache(const distributed_cache&) = delete;
        distributed_cache& operator=(const distributed_cache&) = delete;
        distributed_cache(distributed_cache&&) = delete;
        distributed_cache& operator=(distributed_cache&&) = delete;

        virtual void put(const std::string& key, const std::string& value) = 0;

        /// \throw key_not_found
        virtual std::string get(const std::string& key) const = 0;

    };

    /// Cache for jobs that run in one process.
    class memory_cache: public distributed_cache {

    private:
        using value_table = std::unordered_map<std::string,std::string>;
        using mutex_type = std::mutex;
        using lock_type = std::lock_guard<mutex_type>;

    private:
        value_table _values;
        mutable mutex_type _mutex;

    public:
        void put(const std::string& key, const std::string& value) override;
        std::string get(const std::string& key) const override;

        inline value_table::size_type size() const {
            lock_type lock(this->_mutex);
            return this->_values.size();
        }

    };

    /// \brief Cache that keeps each value in a separate file.
    /// \details The directory is usually on a file system that is
    /// mounted on every node.
    class directory_cache: public distributed_cache {

    private:
        std::string _directory;

    public:
        inline explicit directory_cache(std::string directory):
        _directory(std::move(directory)) {}

        void put(const std::string& key, const std::string& value) override;
        std::string get(const std::string& key) const override;

        inline const std::string& directory() const noexcept { return this->_directory; }

    private:
        std::string path(const std::string& key) const;

    };

    /// Writes the function with its type id to the cache.
    void push_function(distributed_cache& cache, const std::string& key,
                       const function_base& f, function_type_registry& types);

    /// \throw key_not_found
    /// \throw corrupt_descriptor
    function_ptr pull_function(const distributed_cache& cache, const std::string& key,
                               function_type_registry& types);

}

#endif // vim:filetype=cpp
