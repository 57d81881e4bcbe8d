#pragma once
/// @file ring_buffer.hpp
/// @brief Bounded FIFO history that evicts its oldest entry when full.

#include <cstddef>
#include <utility>
#include <vector>

namespace lbsim {

/// @brief Fixed-capacity ring buffer with overwrite-oldest semantics.
///
/// Not synchronized: owned and mutated by the tick thread only. Capacity is
/// chosen at construction (configurable history length) and is at least 1.
template <typename T> class RingBuffer {
public:
  explicit RingBuffer(std::size_t capacity)
      : buffer_(capacity > 0 ? capacity : 1) {}

  /// @brief Append @p item, evicting the oldest entry if full.
  void push(T item) {
    buffer_[head_] = std::move(item);
    head_ = (head_ + 1) % buffer_.size();
    if (size_ < buffer_.size()) {
      ++size_;
    }
  }

  /// @brief Element @p i counted from the oldest (0) to the newest.
  [[nodiscard]] auto at(std::size_t i) const -> const T & {
    return buffer_[(tail() + i) % buffer_.size()];
  }

  /// @brief Most recently pushed element. Requires !empty().
  [[nodiscard]] auto back() const -> const T & {
    return buffer_[(head_ + buffer_.size() - 1) % buffer_.size()];
  }

  /// @brief Copy out the contents, oldest first.
  [[nodiscard]] auto to_vector() const -> std::vector<T> {
    std::vector<T> out;
    out.reserve(size_);
    for (std::size_t i = 0; i < size_; ++i) {
      out.push_back(at(i));
    }
    return out;
  }

  void clear() noexcept {
    head_ = 0;
    size_ = 0;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }
  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return buffer_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return size_ == 0; }
  [[nodiscard]] auto full() const noexcept -> bool {
    return size_ == buffer_.size();
  }

private:
  [[nodiscard]] auto tail() const noexcept -> std::size_t {
    return (head_ + buffer_.size() - size_) % buffer_.size();
  }

  std::vector<T> buffer_;
  std::size_t head_ = 0; ///< Next write slot.
  std::size_t size_ = 0;
};

} // namespace lbsim
