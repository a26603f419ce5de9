#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

/**
 * @brief Error payload wrapper.
 *
 * Keeps the error alternative distinct from the value alternative even when
 * both are strings (Result<std::string>).
 */
template <typename E = std::string>
struct Failure {
  E error;
};

[[nodiscard]] inline Failure<std::string> Err(std::string message) {
  return Failure<std::string>{std::move(message)};
}

template <typename T, typename E = std::string>
class Result {
  std::variant<T, Failure<E>> storage;

public:
  Result(T value)
      : storage(std::in_place_index<0>, std::move(value)) {}
  Result(Failure<E> failure)
      : storage(std::in_place_index<1>, std::move(failure)) {}

  [[nodiscard]] bool isOk() const noexcept { return storage.index() == 0; }
  [[nodiscard]] bool isErr() const noexcept { return storage.index() == 1; }

  [[nodiscard]] const T& value() const& {
    if (isErr()) throw std::runtime_error("Called value on error Result: " + std::get<1>(storage).error);
    return std::get<0>(storage);
  }

  // moves the value out; the Result must not be read afterwards
  T expect(const std::string& msg) {
    if (isErr()) throw std::runtime_error(msg + ": " + std::get<1>(storage).error);
    return std::move(std::get<0>(storage));
  }

  T unwrap() { return expect("Called unwrap on error Result"); }

  [[nodiscard]] const E& error() const {
    if (isOk()) throw std::runtime_error("Called error on ok Result");
    return std::get<1>(storage).error;
  }


  T unwrapOr(T&& defaultValue) { return isOk() ? std::move(std::get<0>(storage)) : std::move(defaultValue); }
};

template <typename E>
class Result<void, E> {
  std::optional<E> failure;

public:
  Result() = default;
  Result(Failure<E> f)
      : failure(std::move(f.error)) {}

  [[nodiscard]] bool isOk() const noexcept { return !failure.has_value(); }
  [[nodiscard]] bool isErr() const noexcept { return failure.has_value(); }

  void expect(const std::string& msg) const {
    if (isErr()) throw std::runtime_error(msg + ": " + *failure);
  }

  [[nodiscard]] const E& error() const {
    if (isOk()) throw std::runtime_error("Called error on ok Result");
    return *failure;
  }

};
