/**
 * @file expected.h
 * @brief Expected<T, E> result type (C++17 subset of std::expected)
 *
 * Holds either a value of type T or an error of type E. Used instead of
 * exceptions for recoverable failures throughout dnsstatd.
 *
 * Example:
 * @code
 * Expected<int, Error> Parse(const std::string& str);
 *
 * auto result = Parse("42");
 * if (!result) {
 *   spdlog::error("{}", result.error().message());
 * }
 * @endcode
 */

#pragma once

#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

namespace dnsstatd::utils {

/**
 * @brief Wrapper marking a value as the error alternative
 */
template <typename E>
class Unexpected {
 public:
  explicit Unexpected(E error) : error_(std::move(error)) {}

  const E& error() const& { return error_; }
  E& error() & { return error_; }
  E&& error() && { return std::move(error_); }

 private:
  E error_;
};

/**
 * @brief Create an Unexpected from an error value
 */
template <typename E>
Unexpected<std::decay_t<E>> MakeUnexpected(E&& error) {
  return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

/**
 * @brief Thrown by value() when an Expected holds an error
 */
template <typename E>
class BadExpectedAccess : public std::exception {
 public:
  explicit BadExpectedAccess(E error) : error_(std::move(error)) {}

  const char* what() const noexcept override { return "Bad Expected access: contains error"; }

  const E& error() const { return error_; }

 private:
  E error_;
};

template <typename T, typename E>
class Expected;

namespace detail {
template <typename U>
struct IsExpected : std::false_type {};

template <typename T, typename E>
struct IsExpected<Expected<T, E>> : std::true_type {};
}  // namespace detail

/**
 * @brief Value-or-error result type
 */
template <typename T, typename E>
class Expected {
 public:
  using value_type = T;
  using error_type = E;

  Expected() : storage_(std::in_place_index<0>) {}

  // NOLINTNEXTLINE(google-explicit-constructor) - Implicit conversion from value is intended
  Expected(const T& value) : storage_(std::in_place_index<0>, value) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}

  template <typename U, typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                                    !std::is_same_v<std::decay_t<U>, Expected> &&
                                                    !std::is_same_v<std::decay_t<U>, T> &&
                                                    !std::is_same_v<std::decay_t<U>, Unexpected<E>>>>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(U&& value) : storage_(std::in_place_index<0>, T(std::forward<U>(value))) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<E>& unexpected) : storage_(std::in_place_index<1>, unexpected.error()) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<E>&& unexpected) : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

  bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T& value() & {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
    return std::get<0>(storage_);
  }

  const T& value() const& {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
    return std::get<0>(storage_);
  }

  T&& value() && {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
    return std::move(std::get<0>(storage_));
  }

  const E& error() const& { return std::get<1>(storage_); }
  E& error() & { return std::get<1>(storage_); }
  E&& error() && { return std::move(std::get<1>(storage_)); }

  T& operator*() & { return std::get<0>(storage_); }
  const T& operator*() const& { return std::get<0>(storage_); }
  T&& operator*() && { return std::move(std::get<0>(storage_)); }

  T* operator->() { return &std::get<0>(storage_); }
  const T* operator->() const { return &std::get<0>(storage_); }

  template <typename U>
  T value_or(U&& default_value) const& {
    return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(default_value));
  }

  template <typename U>
  T value_or(U&& default_value) && {
    return has_value() ? std::move(std::get<0>(storage_)) : static_cast<T>(std::forward<U>(default_value));
  }

  /**
   * @brief Map the value, propagate the error
   */
  template <typename F>
  auto transform(F&& func) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
    using U = std::invoke_result_t<F, const T&>;
    if (!has_value()) {
      return Expected<U, E>(MakeUnexpected(error()));
    }
    if constexpr (std::is_void_v<U>) {
      std::forward<F>(func)(**this);
      return Expected<U, E>();
    } else {
      return Expected<U, E>(std::forward<F>(func)(**this));
    }
  }

  /**
   * @brief Chain an operation returning Expected
   */
  template <typename F>
  auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
    using Result = std::invoke_result_t<F, const T&>;
    static_assert(detail::IsExpected<Result>::value, "and_then callback must return Expected");
    if (!has_value()) {
      return Result(MakeUnexpected(error()));
    }
    return std::forward<F>(func)(**this);
  }

  /**
   * @brief Recover from an error
   */
  template <typename F>
  auto or_else(F&& func) const& -> Expected<T, E> {
    if (has_value()) {
      return *this;
    }
    return std::forward<F>(func)(error());
  }

  /**
   * @brief Map the error, keep the value
   */
  template <typename F>
  auto transform_error(F&& func) const& -> Expected<T, std::invoke_result_t<F, const E&>> {
    using G = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Expected<T, G>(**this);
    }
    return Expected<T, G>(MakeUnexpected(std::forward<F>(func)(error())));
  }

 private:
  std::variant<T, E> storage_;
};

/**
 * @brief Specialization for operations that return no value
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<E>& unexpected) : has_error_(true), error_(unexpected.error()) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<E>&& unexpected) : has_error_(true), error_(std::move(unexpected).error()) {}

  bool has_value() const { return !has_error_; }
  explicit operator bool() const { return has_value(); }

  void value() const {
    if (has_error_) {
      throw BadExpectedAccess<E>(error_);
    }
  }

  const E& error() const& { return error_; }
  E& error() & { return error_; }
  E&& error() && { return std::move(error_); }

  template <typename F>
  auto and_then(F&& func) const -> std::invoke_result_t<F> {
    using Result = std::invoke_result_t<F>;
    static_assert(detail::IsExpected<Result>::value, "and_then callback must return Expected");
    if (has_error_) {
      return Result(MakeUnexpected(error_));
    }
    return std::forward<F>(func)();
  }

  template <typename F>
  auto transform_error(F&& func) const -> Expected<void, std::invoke_result_t<F, const E&>> {
    using G = std::invoke_result_t<F, const E&>;
    if (!has_error_) {
      return Expected<void, G>();
    }
    return Expected<void, G>(MakeUnexpected(std::forward<F>(func)(error_)));
  }

 private:
  bool has_error_ = false;
  E error_{};
};

}  // namespace dnsstatd::utils
