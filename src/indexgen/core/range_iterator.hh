#ifndef INDEXGEN_CORE_RANGE_ITERATOR_HH
#define INDEXGEN_CORE_RANGE_ITERATOR_HH

#include <cmath>
#include <optional>

#include <indexgen/bits/contracts.hh>
#include <indexgen/core/error.hh>
#include <indexgen/core/function.hh>
#include <indexgen/core/split.hh>

namespace ixg {

    /// \brief Lazily evaluates split function over split range.
    /// \details The function is called exactly once for each index,
    /// in ascending order, from the thread that calls \link advance \endlink.
    /// Exceptions thrown by the function are propagated, after that the
    /// iterator must not be advanced.
    template <class T>
    class range_iterator {

    public:
        using value_type = T;
        using function_type = ixg::function<T>;

        enum class states { ready, producing, exhausted };

    private:
        shared_function_ptr _function;
        const function_type* _evaluate = nullptr;
        index_type _start = 0;
        index_type _index = 0;
        index_type _end = 0;
        std::optional<value_type> _value;
        states _state = states::ready;

    public:
        range_iterator() = default;
        ~range_iterator() = default;
        range_iterator(const range_iterator&) = default;
        range_iterator& operator=(const range_iterator&) = default;
        range_iterator(range_iterator&&) = default;
        range_iterator& operator=(range_iterator&&) = default;

        inline explicit range_iterator(const split& s) { initialize(s); }

        /// \throw error if the split function does not return \p T
        void initialize(const split& s) {
            const auto* f = dynamic_cast<const function_type*>(s.function().get());
            if (!f) { throw_error("split function does not produce required values"); }
            this->_function = s.function();
            this->_evaluate = f;
            this->_start = s.start();
            this->_index = s.start();
            this->_end = s.end();
            this->_value.reset();
            this->_state = states::ready;
        }

        bool advance() {
            Expects(this->_evaluate);
            if (this->_index == this->_end) {
                this->_state = states::exhausted;
                this->_value.reset();
                return false;
            }
            this->_value.emplace((*this->_evaluate)(this->_index));
            ++this->_index;
            this->_state = states::producing;
            Ensures(this->_start <= this->_index && this->_index <= this->_end);
            return true;
        }

        /// \throw no_current_value before the first and after the last element
        inline const value_type& current() const {
            if (!this->_value) { throw no_current_value(); }
            return *this->_value;
        }

        /// Index of the current value.
        inline index_type key() const {
            if (!this->_value) { throw no_current_value(); }
            return this->_index - 1;
        }

        /// \brief Fraction of the range that was produced.
        /// \details Equals one only when every value was produced,
        /// including the empty range.
        inline float progress() const noexcept {
            return fraction(this->_index - this->_start, this->_end - this->_start);
        }

        static inline float fraction(index_type done, index_type length) noexcept {
            if (done == length) { return 1.0f; }
            const float result = float(double(done) / double(length));
            return std::fmin(result, std::nextafter(1.0f, 0.0f));
        }

        /// Does nothing, there are no resources to release.
        inline void close() noexcept {}

        inline states state() const noexcept { return this->_state; }
        inline index_type start() const noexcept { return this->_start; }
        inline index_type end() const noexcept { return this->_end; }

    };

}

#endif // vim:filetype=cpp
