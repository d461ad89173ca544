#ifndef INDEXGEN_CORE_THREAD_GROUP_HH
#define INDEXGEN_CORE_THREAD_GROUP_HH

#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

namespace ixg {

    /// \brief Threads that are joined when the group goes out of scope.
    /// \details Failure to start one of the threads leaves the already started
    /// ones joinable, the destructor joins them before the exception leaves
    /// the scope.
    class thread_group {

    private:
        std::vector<std::thread> _threads;

    public:
        thread_group() = default;
        inline ~thread_group() { join(); }
        thread_group(const thread_group&) = delete;
        thread_group& operator=(const thread_group&) = delete;
        thread_group(thread_group&&) = default;
        thread_group& operator=(thread_group&&) = delete;

        template <class Function> inline void
        start(Function&& f) { this->_threads.emplace_back(std::forward<Function>(f)); }

        inline void reserve(size_t n) { this->_threads.reserve(n); }
        inline size_t size() const noexcept { return this->_threads.size(); }

        inline void join() {
            for (auto& t : this->_threads) { if (t.joinable()) { t.join(); } }
        }

    };

}

#endif // vim:filetype=cpp
