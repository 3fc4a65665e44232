#ifndef TNPLANAR_CORE_UTILITY_SINGLETON_HPP
#define TNPLANAR_CORE_UTILITY_SINGLETON_HPP

#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace tnplanar {

/// @brief CRTP base of process-wide objects such as Logger

/// `Derived::instance()` default-constructs the instance on first use;
/// `Derived::set_instance(args...)` constructs it with arguments, once.
/// Derived declares Singleton<Derived> a friend and keeps its constructors
/// private.
template <typename Derived>
class Singleton {
 public:
  /// @return reference to the instance
  static Derived& instance() {
    std::scoped_lock lock(mutex());
    auto& ptr = storage();
    if (!ptr) ptr.reset(new Derived);
    return *ptr;
  }

  /// Constructs the instance from @p args
  /// @throw std::logic_error if the instance already exists
  template <typename... Args>
  static Derived& set_instance(Args&&... args) {
    std::scoped_lock lock(mutex());
    auto& ptr = storage();
    if (ptr)
      throw std::logic_error(
          "tnplanar::Singleton::set_instance: the instance already exists");
    ptr.reset(new Derived(std::forward<Args>(args)...));
    return *ptr;
  }

 protected:
  Singleton() = default;

 private:
  static std::unique_ptr<Derived>& storage() {
    static std::unique_ptr<Derived> instance;
    return instance;
  }
  static std::mutex& mutex() {
    static std::mutex mtx;
    return mtx;
  }
};

}  // namespace tnplanar

#endif  // TNPLANAR_CORE_UTILITY_SINGLETON_HPP
