#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace verdict::common {

/// Construct-once handle for an expensive shared resource.
///
/// The factory runs on the first `get()`; concurrent first callers block
/// until it finishes and then share the same instance. When the factory
/// throws, the exception reaches the caller and the next `get()` retries.
/// The built value is only ever exposed as const.
template <typename T>
class lazy final {
 public:
  using factory_t = std::function<std::unique_ptr<T>()>;

  explicit lazy(factory_t factory) : factory_{std::move(factory)} {}

  lazy(const lazy&) = delete;
  lazy& operator=(const lazy&) = delete;
  lazy(lazy&&) = delete;
  lazy& operator=(lazy&&) = delete;

  const T& get() const {
    if (!ready_.load(std::memory_order_acquire)) {
      auto lock = std::scoped_lock{mutex_};
      if (!value_) {
        auto built = factory_();
        if (!built) {
          throw std::logic_error{"lazy factory returned an empty handle"};
        }
        value_ = std::move(built);
        ready_.store(true, std::memory_order_release);
      }
    }
    return *value_;
  }

  bool ready() const { return ready_; }

 private:
  factory_t factory_;
  mutable std::mutex mutex_;
  mutable std::unique_ptr<const T> value_;
  mutable std::atomic<bool> ready_{false};
};

}  // namespace verdict::common
