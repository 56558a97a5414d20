#pragma once

#include <boost/sml.hpp>
#include <concepts>
#include <cstdint>
#include <type_traits>
#include <utility>

#include "whisker/whisker.h"

namespace whisker {

namespace detail {

template <class Event>
concept has_error_out = requires(const Event & ev) {
  { *ev.error_out } -> std::convertible_to<int32_t>;
};

// An event is only reported as accepted when its error slot stayed clean.
template <class Event>
bool normalize_event_result(const Event & ev, const bool accepted) noexcept {
  if (!accepted) {
    return false;
  }
  if constexpr (has_error_out<Event>) {
    if (ev.error_out != nullptr && *ev.error_out != WHISKER_OK) {
      return false;
    }
  }
  return true;
}

}  // namespace detail

template <class Model, class... Policies>
class sm {
 public:
  using model_type = Model;
  using state_machine_type = boost::sml::sm<Model, Policies...>;

  sm() = default;
  ~sm() = default;

  sm(const sm &) = default;
  sm(sm &&) = default;
  sm & operator=(const sm &) = default;
  sm & operator=(sm &&) = default;

  template <class... Args>
  explicit sm(Args &&... args) : state_machine_(std::forward<Args>(args)...) {}

  template <class Event>
  bool process_event(const Event & ev) {
    return detail::normalize_event_result(ev, state_machine_.process_event(ev));
  }

  template <class State>
  bool is(State state = {}) const {
    return state_machine_.is(state);
  }

 private:
  state_machine_type state_machine_;
};

}  // namespace whisker
