#pragma once

#include <utility>

namespace util {

/**
 * A pointer which owns the lock of the data it points to. The lock is
 * acquired by whoever hands the pointer out and released when the pointer is
 * destroyed, so holding a ScopeExclusivePtr is the token for exclusive access.
 * @tparam T is the type of the stored pointer.
 * @tparam Lockable must have lock() and unlock()
 */
template <typename T, typename Lockable>
class ScopeExclusivePtr {
 public:
  explicit ScopeExclusivePtr(T* data, Lockable* lock = nullptr) noexcept
      : data_(data), lock_(lock) {}

  ScopeExclusivePtr(const ScopeExclusivePtr&) = delete;
  ScopeExclusivePtr& operator=(const ScopeExclusivePtr&) = delete;

  ScopeExclusivePtr(ScopeExclusivePtr&& other) noexcept
      : data_(std::exchange(other.data_, nullptr)),
        lock_(std::exchange(other.lock_, nullptr)) {}

  ~ScopeExclusivePtr() noexcept {
    if (lock_) {
      lock_->unlock();
    }
  }

  T* get() { return data_; }
  T& operator*() { return *data_; }
  T* operator->() { return data_; }

  explicit operator bool() const { return data_ != nullptr; }

 private:
  T* data_;
  Lockable* lock_;
};

}  // namespace util
