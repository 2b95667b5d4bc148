#pragma once
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <fmt/format.h>
#include <ripple/core/log.hpp>

namespace ripple {

enum class event_kind { next, error, completed };

// One unit of the grammar Next* (Error | Completed)?.
// Alternatives are addressed by index so that T may itself be std::exception_ptr.
template <class T>
class event {
public:
  using value_type = T;

  static event next(T value) {
    return event(std::in_place_index<1>, std::move(value));
  }
  static event error(std::exception_ptr e) {
    return event(std::in_place_index<2>, std::move(e));
  }
  static event completed() {
    return event(std::in_place_index<0>);
  }

  event_kind kind() const noexcept {
    switch (data_.index()) {
      case 1:  return event_kind::next;
      case 2:  return event_kind::error;
      default: return event_kind::completed;
    }
  }

  bool is_next() const noexcept      { return data_.index() == 1; }
  bool is_error() const noexcept     { return data_.index() == 2; }
  bool is_completed() const noexcept { return data_.index() == 0; }
  bool is_terminal() const noexcept  { return !is_next(); }

  const T& value() const {
    if (!is_next()) throw std::logic_error("ripple::event: value() on a terminal event");
    return std::get<1>(data_);
  }

  // Null unless this is an error event.
  std::exception_ptr exception() const noexcept {
    return is_error() ? std::get<2>(data_) : std::exception_ptr{};
  }

private:
  template <std::size_t I, class... Args>
  explicit event(std::in_place_index_t<I> tag, Args&&... args)
    : data_(tag, std::forward<Args>(args)...) {}

  std::variant<std::monostate, T, std::exception_ptr> data_;
};

template <class T>
std::string to_string(const event<T>& e) {
  switch (e.kind()) {
    case event_kind::next:
      if constexpr (fmt::is_formattable<T>::value) return fmt::format("next({})", e.value());
      else return "next(...)";
    case event_kind::error:
      return fmt::format("error({})", describe(e.exception()));
    case event_kind::completed:
      return "completed";
  }
  return "?";
}

} // namespace ripple
