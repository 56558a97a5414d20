#pragma once

#include <type_traits>
#include <utility>

namespace whisker {

template <class Signature>
struct callback;

/**
 * Non-owning reference to something callable as `R(Args...)`.
 *
 * The referenced object must outlive every invocation. An empty callback
 * returns a value-initialized `R` when invoked.
 */
template <class R, class... Args>
struct callback<R(Args...)> {
  using result_type = R;
  using thunk_fn = R (*)(void *, Args...);

  void * object = nullptr;
  thunk_fn thunk = nullptr;

  constexpr callback() noexcept = default;
  constexpr callback(void * obj, thunk_fn fn) noexcept : object(obj), thunk(fn) {}

  constexpr explicit operator bool() const noexcept { return thunk != nullptr; }

  R operator()(Args... args) const noexcept {
    if (thunk == nullptr) {
      if constexpr (!std::is_void_v<R>) {
        return R{};
      } else {
        return;
      }
    }
    return thunk(object, std::forward<Args>(args)...);
  }

  template <class T, auto MemFn>
  static constexpr callback from(T * obj) noexcept {
    return callback{
      obj,
      [](void * ptr, Args... args) -> R {
        return (static_cast<T *>(ptr)->*MemFn)(std::forward<Args>(args)...);
      },
    };
  }

  template <class T, auto MemFn>
  static constexpr callback from(const T * obj) noexcept {
    return callback{
      const_cast<T *>(obj),
      [](void * ptr, Args... args) -> R {
        return (static_cast<const T *>(ptr)->*MemFn)(std::forward<Args>(args)...);
      },
    };
  }

  // Binds a closure object (lambda, functor) kept alive by the caller.
  template <class F>
  static constexpr callback bind(F & fn) noexcept {
    return callback{
      static_cast<void *>(&fn),
      [](void * ptr, Args... args) -> R {
        return (*static_cast<F *>(ptr))(std::forward<Args>(args)...);
      },
    };
  }
};

}  // namespace whisker
