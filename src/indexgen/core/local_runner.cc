#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <vector>

#include <unistdx/base/log_message>

#include <indexgen/core/local_runner.hh>
#include <indexgen/core/thread_group.hh>

namespace {

    template <class ... Args> inline void
    log(const Args& ... args) {
        sys::log_message("local", args...);
    }

    inline unsigned default_num_threads() noexcept {
        auto n = std::thread::hardware_concurrency();
        return n == 0 ? 1 : n;
    }

}

ixg::local_runner::local_runner(job_context& context): _context(context) {
    num_threads(context.configuration().get<unsigned>(num_threads_property,
                                                      default_num_threads()));
}

void ixg::local_runner::run(const split_array& splits, worker_type worker) {
    const auto n = splits.size();
    std::vector<std::string> encoded;
    encoded.reserve(n);
    for (const auto& s : splits) { encoded.emplace_back(s.encode(this->_context.types())); }
    std::vector<std::exception_ptr> errors(n);
    std::atomic<size_t> next{0};
    auto& types = this->_context.types();
    auto loop = [&] () {
        for (size_t i=next++; i<n; i=next++) {
            try {
                log("start split _ of _ bytes", i, encoded[i].size());
                auto s = split::decode(encoded[i], types);
                worker(i, s);
                log("finish split _ _", i, s.partition());
            } catch (const std::exception& err) {
                log("split _ failed: _", i, err.what());
                errors[i] = std::current_exception();
            } catch (...) {
                log("split _ failed", i);
                errors[i] = std::current_exception();
            }
        }
    };
    {
        thread_group threads;
        const auto nthreads = std::min(size_t(this->_num_threads), n);
        threads.reserve(nthreads);
        for (size_t i=0; i<nthreads; ++i) { threads.start(loop); }
    }
    for (auto& err : errors) {
        if (err) { std::rethrow_exception(err); }
    }
}
