#ifndef INDEXGEN_CORE_LOCAL_RUNNER_HH
#define INDEXGEN_CORE_LOCAL_RUNNER_HH

#include <functional>
#include <string>
#include <vector>

#include <indexgen/core/job_context.hh>
#include <indexgen/core/partitioned_source.hh>
#include <indexgen/core/split.hh>

namespace ixg {

    /// \brief Runs the splits of a source on local threads.
    /// \details Each split is encoded on the planning side and decoded by
    /// the worker thread, so the function never crosses the thread boundary
    /// as an object. At most \link num_threads \endlink splits are processed
    /// concurrently (configuration key "local.num-threads", defaults to the
    /// number of hardware threads).
    class local_runner {

    public:
        using worker_type = std::function<void(size_t,const split&)>;

    private:
        job_context& _context;
        unsigned _num_threads = 1;

    public:
        explicit local_runner(job_context& context);

        inline unsigned num_threads() const noexcept { return this->_num_threads; }
        inline void num_threads(unsigned rhs) noexcept { this->_num_threads = rhs == 0 ? 1 : rhs; }

        /// \brief Calls \p worker with the decoded copy of each split.
        /// \details Rethrows the exception of the first failed split
        /// after all threads have finished.
        void run(const split_array& splits, worker_type worker);

        /// Reads all elements of the source in index order.
        template <class T> std::vector<T>
        collect(const partitioned_source<T>& source, const job_configuration& conf) {
            auto splits = source.partitions(conf);
            std::vector<std::vector<T>> parts(splits.size());
            run(splits, [&source,&parts] (size_t i, const split& s) {
                auto it = source.iterate(s);
                auto& part = parts[i];
                part.reserve(s.length());
                while (it.advance()) { part.emplace_back(it.current()); }
                it.close();
            });
            std::vector<T> result;
            result.reserve(source.input_size());
            for (auto& part : parts) {
                for (auto& x : part) { result.emplace_back(std::move(x)); }
            }
            return result;
        }

    };

    /// Configuration key for the number of worker threads of the local runner.
    constexpr const char* const num_threads_property = "local.num-threads";

}

#endif // vim:filetype=cpp
