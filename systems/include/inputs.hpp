#ifndef INPUTS_HPP
#define INPUTS_HPP

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>


namespace affine {


/**
 * @brief First n elements of an input, iterated lazily.
 *
 * Every call to begin() starts again from the first element. The sequence
 * shares ownership of the input's values and stays valid after the input
 * itself is gone.
 */
template <typename Iterator>
class InputSequence {
  public:
    InputSequence(Iterator first, Iterator last, std::shared_ptr<const void> owner = nullptr)
        : first_{first}, last_{last}, owner_{std::move(owner)} {}

    Iterator begin() const { return first_; };
    Iterator end() const { return last_; };

    std::size_t size() const { return static_cast<std::size_t>(std::distance(first_, last_)); };
    bool empty() const { return first_ == last_; };

  private:
    Iterator first_;
    Iterator last_;
    std::shared_ptr<const void> owner_;
};


/// @brief Input that remains constant in time. Its sequence of elements is infinite.
template <typename T>
class ConstantInput {
  public:
    using value_type = T;

    class Iterator {
      public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        Iterator() = default;
        Iterator(std::shared_ptr<const T> U, std::size_t state) : U_{std::move(U)}, state_{state} {}

        reference operator*() const { return *U_; };
        pointer operator->() const { return U_.get(); };

        Iterator& operator++() {
            ++state_;
            return *this;
        }

        Iterator operator++(int) {
            Iterator previous = *this;
            ++state_;
            return previous;
        }

        bool operator==(const Iterator& other) const { return state_ == other.state_; };

        /// @brief Number of times this iterator was advanced
        std::size_t state() const { return state_; };

      private:
        // Shared with the input, keeps the value alive for detached sequences
        std::shared_ptr<const T> U_{};
        std::size_t state_{0};
    };

    explicit ConstantInput(T U) : U_{std::make_shared<T>(std::move(U))} {}

    const T& U() const { return *U_; };

    // No end(): the sequence never terminates
    Iterator begin() const { return Iterator(U_, 0); };

    /// @brief n repetitions of the constant input
    InputSequence<Iterator> nextinput(std::size_t n = 1) const {
        return InputSequence<Iterator>(Iterator(U_, 0), Iterator(U_, n));
    }

  private:
    std::shared_ptr<const T> U_;
};


/// @brief Input that may vary with time. Its length is the number of stored elements.
template <typename T>
class VaryingInput {
  public:
    using value_type = T;
    using Iterator = typename std::vector<T>::const_iterator;

    explicit VaryingInput(std::vector<T> U) : U_{std::make_shared<std::vector<T>>(std::move(U))} {}

    const std::vector<T>& U() const { return *U_; };

    std::size_t size() const { return U_->size(); };

    Iterator begin() const { return U_->cbegin(); };
    Iterator end() const { return U_->cend(); };

    /// @brief At most the first n elements, in stored order
    InputSequence<Iterator> nextinput(std::size_t n = 1) const {
        const auto count = static_cast<std::ptrdiff_t>(std::min(n, U_->size()));
        return InputSequence<Iterator>(U_->cbegin(), U_->cbegin() + count, U_);
    }

  private:
    std::shared_ptr<const std::vector<T>> U_;
};


}  // namespace affine


#endif  // INPUTS_HPP
